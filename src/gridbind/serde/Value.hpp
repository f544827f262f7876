#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace gridbind {
namespace serde {

/**
 * @brief 无类型的解码结果：null / bool / number / string / array / object
 *
 * object 保持插入顺序（即表头列顺序）。
 */
class Value {
public:
    using Array = std::vector<Value>;
    using Object = std::vector<std::pair<std::string, Value>>;

    enum class Type {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object
    };

    Value() = default;
    explicit Value(bool value) : storage_(value) {}
    explicit Value(double value) : storage_(value) {}
    explicit Value(std::string value) : storage_(std::move(value)) {}
    explicit Value(const char* value) : storage_(std::string(value)) {}
    explicit Value(Array value) : storage_(std::move(value)) {}
    explicit Value(Object value) : storage_(std::move(value)) {}

    static Value null() { return Value(); }

    Type type() const { return static_cast<Type>(storage_.index()); }

    bool isNull() const { return type() == Type::Null; }
    bool isBool() const { return type() == Type::Bool; }
    bool isNumber() const { return type() == Type::Number; }
    bool isString() const { return type() == Type::String; }
    bool isArray() const { return type() == Type::Array; }
    bool isObject() const { return type() == Type::Object; }

    // 类型不符时抛出 std::bad_variant_access
    bool asBool() const { return std::get<bool>(storage_); }
    double asNumber() const { return std::get<double>(storage_); }
    const std::string& asString() const { return std::get<std::string>(storage_); }
    const Array& asArray() const { return std::get<Array>(storage_); }
    const Object& asObject() const { return std::get<Object>(storage_); }

    /**
     * @brief 在 object 中按键查找，非 object 或未找到时返回 nullptr
     */
    const Value* find(std::string_view key) const;

    /**
     * @brief array 或 object 的元素数，其余为 0
     */
    size_t size() const;

    /**
     * @brief 紧凑的 JSON 风格文本
     */
    std::string toString() const;

    bool operator==(const Value& other) const { return storage_ == other.storage_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, bool, double, std::string, Array, Object> storage_;
};

}} // namespace gridbind::serde
