#ifndef RECACHE_UTIL_JOURNALED_MAP_H
#define RECACHE_UTIL_JOURNALED_MAP_H

#include <ankerl/unordered_dense.h>

#include <optional>
#include <utility>

namespace recache {

    /**
     * Hash map with transactional semantics. The first modification of a key after a commit saves a copy of
     * its previous entry (or its absence); rollback() restores every saved entry.
     *
     * References returned by emplace() and modify() are invalidated by the next emplace or erase.
     */
    template<typename K, typename V>
    class JournaledMap {
    public:
        using map_type = ankerl::unordered_dense::map<K, V>;

        [[nodiscard]] const V *find(const K &key) const {
            auto it = _items.find(key);
            return it == _items.end() ? nullptr : &it->second;
        }

        [[nodiscard]] bool contains(const K &key) const { return _items.contains(key); }

        [[nodiscard]] std::size_t size() const { return _items.size(); }

        [[nodiscard]] bool empty() const { return _items.empty(); }

        [[nodiscard]] typename map_type::const_iterator begin() const { return _items.begin(); }
        [[nodiscard]] typename map_type::const_iterator end() const { return _items.end(); }

        V &emplace(const K &key, V value) {
            save(key);
            auto [it, inserted] = _items.insert_or_assign(key, std::move(value));
            return it->second;
        }

        // nullptr when the key is absent
        V *modify(const K &key) {
            auto it = _items.find(key);
            if (it == _items.end()) { return nullptr; }
            save(key);
            return &it->second;
        }

        bool erase(const K &key) {
            if (!_items.contains(key)) { return false; }
            save(key);
            _items.erase(key);
            return true;
        }

        void commit() { _saved.clear(); }

        void rollback() {
            for (auto &[key, previous] : _saved) {
                if (previous) {
                    _items.insert_or_assign(key, std::move(*previous));
                } else {
                    _items.erase(key);
                }
            }
            _saved.clear();
        }

        // Drops every entry without journaling, the map must be committed
        void clear() {
            _items.clear();
            _saved.clear();
        }

    private:
        void save(const K &key) {
            if (_saved.contains(key)) { return; }
            auto it = _items.find(key);
            if (it == _items.end()) {
                _saved.emplace(key, std::nullopt);
            } else {
                _saved.emplace(key, std::optional<V>{it->second});
            }
        }

        map_type _items;
        ankerl::unordered_dense::map<K, std::optional<V>> _saved;
    };

} // namespace recache

#endif // RECACHE_UTIL_JOURNALED_MAP_H
