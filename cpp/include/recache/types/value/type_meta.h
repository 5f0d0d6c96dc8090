//
// Type descriptors for slot payloads. A TypeMeta pointer is the type tag of a Value slot.
//

#ifndef RECACHE_VALUE_TYPE_META_H
#define RECACHE_VALUE_TYPE_META_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <typeinfo>

namespace recache::value {

    struct TypeMeta;

    /**
     * TypeOps - Function pointers for type operations
     *
     * All operations take raw pointers and the TypeMeta for context.
     * This enables type-erased operations on any payload stored in the slot table.
     */
    struct TypeOps {
        // Lifecycle
        void (*destruct)(void* dest, const TypeMeta* meta);
        void (*copy_construct)(void* dest, const void* src, const TypeMeta* meta);
        void (*move_construct)(void* dest, void* src, const TypeMeta* meta);

        // Assignment
        void (*copy_assign)(void* dest, const void* src, const TypeMeta* meta);
        void (*move_assign)(void* dest, void* src, const TypeMeta* meta);

        // Comparison (nullptr when the type has no operator==)
        bool (*equals)(const void* a, const void* b, const TypeMeta* meta);

        size_t (*hash)(const void* v, const TypeMeta* meta);

        // String representation (for dumps and traces)
        std::string (*to_string)(const void* v, const TypeMeta* meta);

        std::string (*type_name)(const TypeMeta* meta);
    };

    /**
     * TypeFlags - Properties of a type
     */
    enum class TypeFlags : uint32_t {
        None = 0,
        TriviallyDestructible = 1 << 0,
        TriviallyCopyable = 1 << 1,
        Copyable = 1 << 2,
        Equatable = 1 << 3,
        Hashable = 1 << 4,
    };

    inline TypeFlags operator|(TypeFlags a, TypeFlags b) {
        return static_cast<TypeFlags>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
    }

    inline TypeFlags operator&(TypeFlags a, TypeFlags b) {
        return static_cast<TypeFlags>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
    }

    inline bool has_flag(TypeFlags flags, TypeFlags test) {
        return (static_cast<uint32_t>(flags) & static_cast<uint32_t>(test)) != 0;
    }

    /**
     * TypeMeta - Complete metadata for a payload type
     *
     * There is exactly one TypeMeta instance per C++ type, so two payloads have the same type
     * if and only if their TypeMeta pointers compare equal.
     */
    struct TypeMeta {
        size_t size;            // sizeof(T)
        size_t alignment;       // alignof(T)
        TypeFlags flags;
        const TypeOps* ops;
        const std::type_info* type_info;
        const char* name;       // Human-readable name (optional)

        [[nodiscard]] bool is_copyable() const { return has_flag(flags, TypeFlags::Copyable); }

        [[nodiscard]] bool is_equatable() const { return has_flag(flags, TypeFlags::Equatable); }

        [[nodiscard]] bool is_hashable() const { return has_flag(flags, TypeFlags::Hashable); }

        [[nodiscard]] bool is_trivially_destructible() const {
            return has_flag(flags, TypeFlags::TriviallyDestructible);
        }

        void destruct_at(void* dest) const {
            if (ops->destruct) ops->destruct(dest, this);
        }

        void copy_construct_at(void* dest, const void* src) const {
            if (ops->copy_construct) ops->copy_construct(dest, src, this);
        }

        void move_construct_at(void* dest, void* src) const {
            if (ops->move_construct) ops->move_construct(dest, src, this);
        }

        void copy_assign_at(void* dest, const void* src) const {
            if (ops->copy_assign) ops->copy_assign(dest, src, this);
        }

        void move_assign_at(void* dest, void* src) const {
            if (ops->move_assign) ops->move_assign(dest, src, this);
        }

        [[nodiscard]] bool equals_at(const void* a, const void* b) const {
            return ops->equals ? ops->equals(a, b, this) : false;
        }

        [[nodiscard]] size_t hash_at(const void* v) const {
            return ops->hash ? ops->hash(v, this) : 0;
        }

        [[nodiscard]] std::string to_string_at(const void* v) const {
            return ops->to_string ? ops->to_string(v, this) : "<no to_string>";
        }

        [[nodiscard]] std::string type_name_str() const {
            return ops->type_name ? ops->type_name(this) : (name ? name : "<unknown>");
        }
    };

    /**
     * TypedPtr - A type-erased pointer with metadata
     *
     * Non-owning view over a payload.
     */
    struct TypedPtr {
        void* ptr{nullptr};
        const TypeMeta* meta{nullptr};

        TypedPtr() = default;
        TypedPtr(void* p, const TypeMeta* m) : ptr(p), meta(m) {}

        [[nodiscard]] bool valid() const { return ptr && meta; }

        template<typename T>
        [[nodiscard]] T& as() const { return *static_cast<T*>(ptr); }
    };

    struct ConstTypedPtr {
        const void* ptr{nullptr};
        const TypeMeta* meta{nullptr};

        ConstTypedPtr() = default;
        ConstTypedPtr(const void* p, const TypeMeta* m) : ptr(p), meta(m) {}
        ConstTypedPtr(TypedPtr p) : ptr(p.ptr), meta(p.meta) {}

        [[nodiscard]] bool valid() const { return ptr && meta; }

        template<typename T>
        [[nodiscard]] const T& as() const { return *static_cast<const T*>(ptr); }

        [[nodiscard]] std::string to_string() const { return valid() ? meta->to_string_at(ptr) : "<none>"; }
    };

} // namespace recache::value

#endif // RECACHE_VALUE_TYPE_META_H
