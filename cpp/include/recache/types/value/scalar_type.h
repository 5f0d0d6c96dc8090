//
// TypeMeta generation for arbitrary C++ payload types, and the owning TypedValue.
//

#ifndef RECACHE_VALUE_SCALAR_TYPE_H
#define RECACHE_VALUE_SCALAR_TYPE_H

#include <recache/types/value/type_meta.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <ankerl/unordered_dense.h>

#include <concepts>
#include <new>
#include <string>
#include <type_traits>
#include <utility>

namespace recache::value {

    /**
     * ScalarTypeOps - Generate TypeOps for a payload type T
     */
    template<typename T>
    struct ScalarTypeOps {
        static void destruct(void* dest, const TypeMeta*) {
            static_cast<T*>(dest)->~T();
        }

        static void copy_construct(void* dest, const void* src, const TypeMeta*) {
            new (dest) T(*static_cast<const T*>(src));
        }

        static void move_construct(void* dest, void* src, const TypeMeta*) {
            new (dest) T(std::move(*static_cast<T*>(src)));
        }

        static void copy_assign(void* dest, const void* src, const TypeMeta*) {
            *static_cast<T*>(dest) = *static_cast<const T*>(src);
        }

        static void move_assign(void* dest, void* src, const TypeMeta*) {
            *static_cast<T*>(dest) = std::move(*static_cast<T*>(src));
        }

        static bool equals(const void* a, const void* b, const TypeMeta*) {
            return *static_cast<const T*>(a) == *static_cast<const T*>(b);
        }

        static size_t hash(const void* v, const TypeMeta*) {
            return ankerl::unordered_dense::hash<T>{}(*static_cast<const T*>(v));
        }

        static std::string to_string(const void* v, const TypeMeta* meta) {
            const T& value = *static_cast<const T*>(v);
            if constexpr (std::is_same_v<T, bool>) {
                return value ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return fmt::format("\"{}\"", value);
            } else if constexpr (fmt::is_formattable<T>::value) {
                return fmt::format("{}", value);
            } else {
                return fmt::format("<{}>", type_name(meta));
            }
        }

        static std::string type_name(const TypeMeta* meta) {
            if (meta->name) return meta->name;
            if (meta->type_info) return meta->type_info->name();
            return "<unknown>";
        }

        static constexpr TypeOps make_ops() {
            TypeOps result{};
            result.destruct = destruct;
            if constexpr (std::is_copy_constructible_v<T>) {
                result.copy_construct = copy_construct;
            }
            result.move_construct = move_construct;
            if constexpr (std::is_copy_assignable_v<T>) {
                result.copy_assign = copy_assign;
            }
            if constexpr (std::is_move_assignable_v<T>) {
                result.move_assign = move_assign;
            }
            if constexpr (std::equality_comparable<T>) {
                result.equals = equals;
            }
            if constexpr (requires(const T& x) { std::hash<T>{}(x); }) {
                result.hash = hash;
            }
            result.to_string = to_string;
            result.type_name = type_name;
            return result;
        }

        static const TypeOps ops;
    };

    template<typename T>
    const TypeOps ScalarTypeOps<T>::ops = ScalarTypeOps<T>::make_ops();

    /**
     * Compute TypeFlags for a type T
     */
    template<typename T>
    constexpr TypeFlags compute_flags() {
        TypeFlags flags = TypeFlags::None;

        if constexpr (std::is_trivially_destructible_v<T>) {
            flags = flags | TypeFlags::TriviallyDestructible;
        }
        if constexpr (std::is_trivially_copyable_v<T>) {
            flags = flags | TypeFlags::TriviallyCopyable;
        }
        if constexpr (std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>) {
            flags = flags | TypeFlags::Copyable;
        }
        if constexpr (std::equality_comparable<T>) {
            flags = flags | TypeFlags::Equatable;
        }
        if constexpr (requires(const T& x) { std::hash<T>{}(x); }) {
            flags = flags | TypeFlags::Hashable;
        }
        return flags;
    }

    /**
     * ScalarTypeMeta - TypeMeta for payload types
     *
     * Usage:
     *   const TypeMeta* int_meta = ScalarTypeMeta<int>::get();
     */
    template<typename T>
    struct ScalarTypeMeta {
        static const TypeMeta instance;

        static const TypeMeta* get() { return &instance; }
    };

    template<typename T>
    const TypeMeta ScalarTypeMeta<T>::instance = {
        .size = sizeof(T),
        .alignment = alignof(T),
        .flags = compute_flags<T>(),
        .ops = &ScalarTypeOps<T>::ops,
        .type_info = &typeid(T),
        .name = nullptr,
    };

    template<typename T>
    const TypeMeta* scalar_type_meta() {
        return ScalarTypeMeta<std::remove_cvref_t<T>>::get();
    }

    /**
     * TypedValue - Owns heap storage for a payload with its TypeMeta
     *
     * The storage address never changes while the TypedValue is alive, moving the TypedValue moves the
     * ownership only. Slot payloads rely on this: handles point at the storage while the slot itself is
     * shuffled around the table.
     */
    class TypedValue {
    public:
        TypedValue() = default;

        template<typename T, typename... Args>
        static TypedValue create(Args&&... args) {
            const TypeMeta* meta = scalar_type_meta<T>();
            TypedValue tv{allocate(meta), meta};
            try {
                new (tv._storage) T(std::forward<Args>(args)...);
            } catch (...) {
                ::operator delete(tv._storage, std::align_val_t{meta->alignment});
                tv._storage = nullptr;
                throw;
            }
            return tv;
        }

        template<typename T>
        static TypedValue of(T&& value) {
            return create<std::remove_cvref_t<T>>(std::forward<T>(value));
        }

        // Deep copy, the type must be copyable
        static TypedValue copy_of(ConstTypedPtr src) {
            if (!src.valid()) { return {}; }
            TypedValue tv{allocate(src.meta), src.meta};
            src.meta->copy_construct_at(tv._storage, src.ptr);
            return tv;
        }

        ~TypedValue() { reset(); }

        TypedValue(TypedValue&& other) noexcept : _storage(other._storage), _meta(other._meta) {
            other._storage = nullptr;
            other._meta = nullptr;
        }

        TypedValue& operator=(TypedValue&& other) noexcept {
            if (this != &other) {
                reset();
                _storage = other._storage;
                _meta = other._meta;
                other._storage = nullptr;
                other._meta = nullptr;
            }
            return *this;
        }

        TypedValue(const TypedValue&) = delete;
        TypedValue& operator=(const TypedValue&) = delete;

        [[nodiscard]] bool valid() const { return _storage && _meta; }
        [[nodiscard]] const TypeMeta* meta() const { return _meta; }

        template<typename T>
        [[nodiscard]] bool is() const { return _meta == scalar_type_meta<T>(); }

        [[nodiscard]] TypedPtr ptr() { return {_storage, _meta}; }
        [[nodiscard]] ConstTypedPtr ptr() const { return {_storage, _meta}; }

        template<typename T>
        [[nodiscard]] T& as() { return *static_cast<T*>(_storage); }

        template<typename T>
        [[nodiscard]] const T& as() const { return *static_cast<const T*>(_storage); }

        [[nodiscard]] bool equals(const TypedValue& other) const {
            if (!valid() || !other.valid() || _meta != other._meta) return false;
            return _meta->equals_at(_storage, other._storage);
        }

        [[nodiscard]] size_t hash() const {
            return valid() ? _meta->hash_at(_storage) : 0;
        }

        [[nodiscard]] std::string to_string() const { return ptr().to_string(); }

        void reset() {
            if (_storage && _meta) {
                _meta->destruct_at(_storage);
                ::operator delete(_storage, std::align_val_t{_meta->alignment});
            }
            _storage = nullptr;
            _meta = nullptr;
        }

    private:
        TypedValue(void* storage, const TypeMeta* meta) : _storage(storage), _meta(meta) {}

        static void* allocate(const TypeMeta* meta) {
            return ::operator new(meta->size, std::align_val_t{meta->alignment});
        }

        void* _storage{nullptr};
        const TypeMeta* _meta{nullptr};
    };

} // namespace recache::value

#endif // RECACHE_VALUE_SCALAR_TYPE_H
