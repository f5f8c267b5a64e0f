#include "Value.h"

#include <cmath>
#include <sstream>
#include <iomanip>

namespace WorkerHost {

    Value Value::MakeArray(std::vector<Value> items) {
        Value v;
        v.m_type = Type::Array;
        v.m_items = std::move(items);
        return v;
    }

    Value Value::MakeObject() {
        Value v;
        v.m_type = Type::Object;
        return v;
    }

    void Value::Push(Value v) {
        if (m_type != Type::Array) {
            *this = MakeArray();
        }
        m_items.push_back(std::move(v));
    }

    void Value::Set(const std::string& key, Value v) {
        if (m_type != Type::Object) {
            *this = MakeObject();
        }
        for (size_t i = 0; i < m_keys.size(); ++i) {
            if (m_keys[i] == key) {
                m_items[i] = std::move(v);
                return;
            }
        }
        m_keys.push_back(key);
        m_items.push_back(std::move(v));
    }

    const Value* Value::Get(const std::string& key) const {
        if (m_type != Type::Object) return nullptr;
        for (size_t i = 0; i < m_keys.size(); ++i) {
            if (m_keys[i] == key) return &m_items[i];
        }
        return nullptr;
    }

    static std::string NumberToString(double n) {
        if (std::isnan(n)) return "NaN";
        if (std::isinf(n)) return n > 0 ? "Infinity" : "-Infinity";
        if (std::floor(n) == n && std::fabs(n) < 1e15) {
            std::ostringstream oss;
            oss << static_cast<long long>(n);
            return oss.str();
        }
        std::ostringstream oss;
        oss << std::setprecision(15) << n;
        return oss.str();
    }

    std::string Value::ToDisplayString() const {
        switch (m_type) {
        case Type::Nil: return "null";
        case Type::Boolean: return m_bool ? "true" : "false";
        case Type::Number: return NumberToString(m_number);
        case Type::String: return m_string;
        case Type::Array: return ArrayToString(m_items);
        case Type::Object: {
            std::string out = "{";
            for (size_t i = 0; i < m_keys.size(); ++i) {
                if (i > 0) out += ", ";
                out += m_keys[i] + ": " + m_items[i].ToDisplayString();
            }
            return out + "}";
        }
        }
        return std::string();
    }

    bool Value::operator==(const Value& other) const {
        if (m_type != other.m_type) return false;
        switch (m_type) {
        case Type::Nil: return true;
        case Type::Boolean: return m_bool == other.m_bool;
        case Type::Number: return m_number == other.m_number;
        case Type::String: return m_string == other.m_string;
        case Type::Array: return m_items == other.m_items;
        case Type::Object: return m_keys == other.m_keys && m_items == other.m_items;
        }
        return false;
    }

    std::string ArrayToString(const ValueList& values) {
        std::string out = "[";
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) out += ", ";
            out += values[i].ToDisplayString();
        }
        return out + "]";
    }

    std::string JoinDisplay(const ValueList& values) {
        std::string out;
        for (const auto& v : values) {
            out += v.ToDisplayString();
        }
        return out;
    }

} // namespace WorkerHost
