#pragma once
// Value.h
//
// Host-side structured value exchanged with guest scripts: script arguments, host function
// arguments/results, port messages and persisted argument vectors.
//
// Objects keep their keys in insertion order.

#include <cstdint>
#include <string>
#include <vector>

namespace WorkerHost {

    class Value {
    public:
        enum class Type : uint8_t {
            Nil = 0,
            Boolean,
            Number,
            String,
            Array,
            Object
        };

        Value() = default;
        Value(std::nullptr_t) {}
        Value(bool b) : m_type(Type::Boolean), m_bool(b) {}
        Value(int n) : m_type(Type::Number), m_number(static_cast<double>(n)) {}
        Value(double n) : m_type(Type::Number), m_number(n) {}
        Value(const char* s) : m_type(Type::String), m_string(s ? s : "") {}
        Value(std::string s) : m_type(Type::String), m_string(std::move(s)) {}

        static Value MakeArray(std::vector<Value> items = {});
        static Value MakeObject();

        Type GetType() const { return m_type; }
        bool IsNil() const { return m_type == Type::Nil; }
        bool IsBool() const { return m_type == Type::Boolean; }
        bool IsNumber() const { return m_type == Type::Number; }
        bool IsString() const { return m_type == Type::String; }
        bool IsArray() const { return m_type == Type::Array; }
        bool IsObject() const { return m_type == Type::Object; }

        bool AsBool() const { return m_bool; }
        double AsNumber() const { return m_number; }
        const std::string& AsString() const { return m_string; }

        // Array elements, or object values (parallel to Keys()).
        const std::vector<Value>& Items() const { return m_items; }
        std::vector<Value>& Items() { return m_items; }
        const std::vector<std::string>& Keys() const { return m_keys; }
        size_t Size() const { return m_items.size(); }

        void Push(Value v);
        // Replaces an existing key's value or appends the key.
        void Set(const std::string& key, Value v);
        const Value* Get(const std::string& key) const;

        // Display form: integers without fraction, arrays as "[a, b]", objects as "{k: v}".
        std::string ToDisplayString() const;

        bool operator==(const Value& other) const;
        bool operator!=(const Value& other) const { return !(*this == other); }

    private:
        Type m_type = Type::Nil;
        bool m_bool = false;
        double m_number = 0.0;
        std::string m_string;
        std::vector<Value> m_items;
        std::vector<std::string> m_keys;
    };

    using ValueList = std::vector<Value>;

    // "[a, b, c]" rendering used in log lines and user notices.
    std::string ArrayToString(const ValueList& values);

    // Concatenated display form of a call's arguments (print/tprint).
    std::string JoinDisplay(const ValueList& values);

} // namespace WorkerHost
