/**
 * @file Deserialize.hpp
 * @brief Deserialize<T> 特征：把目标类型的形态翻译成对 Deserializer 的请求
 *
 * 内置支持 bool、定宽整数、float/double、std::string、std::optional、
 * std::vector、std::map、std::tuple、std::monostate、IgnoredAny 和 Value。
 * 用户类型通过 DeserializeStruct / DeserializeEnum 声明字段或变体。
 */

#pragma once

#include "gridbind/serde/Visitor.hpp"
#include "gridbind/serde/Value.hpp"
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <fmt/format.h>

namespace gridbind {
namespace serde {

/**
 * @brief 反序列化特征，未特化的类型在编译期报错
 */
template<typename T, typename Enable = void>
struct Deserialize;

/**
 * @brief 读取并丢弃任意值
 */
struct IgnoredAny {};

template<typename T>
core::Result<T> deserialize(Deserializer& deserializer) {
    return Deserialize<T>::deserialize(deserializer);
}

// ========== 种子与访问辅助 ==========

/**
 * @brief 把 Deserialize<T> 适配为种子，结果保存在 value 中
 */
template<typename T>
class TypedSeed : public DeserializeSeed {
public:
    core::VoidResult deserialize(Deserializer& deserializer) override {
        auto result = Deserialize<T>::deserialize(deserializer);
        if (result.hasError()) {
            return std::move(result).error();
        }
        value.emplace(std::move(result).value());
        return core::success();
    }

    std::optional<T> value;
};

template<typename T>
core::Result<std::optional<T>> nextElement(SeqAccess& seq) {
    TypedSeed<T> seed;
    auto more = seq.nextElementSeed(seed);
    if (more.hasError()) {
        return std::move(more).error();
    }
    if (!more.value()) {
        return std::optional<T>();
    }
    return std::move(seed.value);
}

template<typename K>
core::Result<std::optional<K>> nextKey(MapAccess& map) {
    TypedSeed<K> seed;
    auto more = map.nextKeySeed(seed);
    if (more.hasError()) {
        return std::move(more).error();
    }
    if (!more.value()) {
        return std::optional<K>();
    }
    return std::move(seed.value);
}

template<typename V>
core::Result<V> nextValue(MapAccess& map) {
    TypedSeed<V> seed;
    GRIDBIND_TRY(map.nextValueSeed(seed));
    return std::move(*seed.value);
}

namespace detail {

template<typename T>
struct IsOptional : std::false_type {};

template<typename T>
struct IsOptional<std::optional<T>> : std::true_type {};

template<typename T>
std::string integerName() {
    return fmt::format("{}{}", std::is_signed<T>::value ? "i" : "u", sizeof(T) * 8);
}

template<typename T>
core::VoidResult requestInteger(Deserializer& d, Visitor& visitor) {
    if constexpr (std::is_signed<T>::value) {
        if constexpr (sizeof(T) == 1) return d.deserializeI8(visitor);
        else if constexpr (sizeof(T) == 2) return d.deserializeI16(visitor);
        else if constexpr (sizeof(T) == 4) return d.deserializeI32(visitor);
        else return d.deserializeI64(visitor);
    } else {
        if constexpr (sizeof(T) == 1) return d.deserializeU8(visitor);
        else if constexpr (sizeof(T) == 2) return d.deserializeU16(visitor);
        else if constexpr (sizeof(T) == 4) return d.deserializeU32(visitor);
        else return d.deserializeU64(visitor);
    }
}

/**
 * @brief 对 tuple 的每个元素按下标调用 func(index, element)
 */
template<typename Tuple, typename F, size_t... I>
void forEachIndexed(Tuple& tuple, F&& func, std::index_sequence<I...>) {
    (func(I, std::get<I>(tuple)), ...);
}

template<typename Tuple, typename F>
void forEachIndexed(Tuple& tuple, F&& func) {
    forEachIndexed(tuple, std::forward<F>(func),
                   std::make_index_sequence<std::tuple_size<std::decay_t<Tuple>>::value>());
}

std::string joinNames(const FieldNames& names);

/**
 * @brief 字段/变体名识别：visitStr 按名称匹配，visitU64 按下标
 *
 * reject_unknown 为 true 时（枚举变体）未知名称直接报错；
 * 否则记为未知，由调用方忽略该字段。
 */
class IdentifierSeed : public DeserializeSeed, private Visitor {
public:
    IdentifierSeed(const FieldNames& names, bool reject_unknown)
        : names_(names), reject_unknown_(reject_unknown) {}

    core::VoidResult deserialize(Deserializer& deserializer) override {
        index_.reset();
        return deserializer.deserializeIdentifier(*this);
    }

    /**
     * @brief 匹配到的下标，未知名称为 std::nullopt
     */
    const std::optional<size_t>& index() const { return index_; }

private:
    std::string expecting() const override {
        return reject_unknown_ ? "variant identifier" : "field identifier";
    }

    core::VoidResult visitStr(std::string_view value) override;
    core::VoidResult visitU64(uint64_t value) override;

    const FieldNames& names_;
    bool reject_unknown_;
    std::optional<size_t> index_;
};

} // namespace detail

// ========== 标量 ==========

template<>
struct Deserialize<bool> {
    static core::Result<bool> deserialize(Deserializer& d) {
        struct BoolVisitor : Visitor {
            bool value = false;
            std::string expecting() const override { return "a boolean"; }
            core::VoidResult visitBool(bool v) override {
                value = v;
                return core::success();
            }
        } visitor;
        GRIDBIND_TRY(d.deserializeBool(visitor));
        return visitor.value;
    }
};

/**
 * @brief 定宽整数：64 位访问结果按目标宽度做范围检查
 */
template<typename T>
struct Deserialize<T, std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value>> {
    static core::Result<T> deserialize(Deserializer& d) {
        struct IntegerVisitor : Visitor {
            T value{};
            std::string expecting() const override { return detail::integerName<T>(); }

            core::VoidResult visitI64(int64_t v) override {
                bool fits;
                if constexpr (std::is_signed<T>::value) {
                    fits = v >= static_cast<int64_t>(std::numeric_limits<T>::min()) &&
                           v <= static_cast<int64_t>(std::numeric_limits<T>::max());
                } else {
                    fits = v >= 0 &&
                           static_cast<uint64_t>(v) <= static_cast<uint64_t>(std::numeric_limits<T>::max());
                }
                if (!fits) {
                    return invalidValue(fmt::format("integer `{}`", v));
                }
                value = static_cast<T>(v);
                return core::success();
            }

            core::VoidResult visitU64(uint64_t v) override {
                if (v > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
                    return invalidValue(fmt::format("integer `{}`", v));
                }
                value = static_cast<T>(v);
                return core::success();
            }
        } visitor;
        GRIDBIND_TRY(detail::requestInteger<T>(d, visitor));
        return visitor.value;
    }
};

template<typename T>
struct Deserialize<T, std::enable_if_t<std::is_floating_point<T>::value>> {
    static core::Result<T> deserialize(Deserializer& d) {
        struct FloatVisitor : Visitor {
            T value{};
            std::string expecting() const override { return sizeof(T) == 4 ? "f32" : "f64"; }
            core::VoidResult visitF64(double v) override {
                value = static_cast<T>(v);
                return core::success();
            }
            core::VoidResult visitI64(int64_t v) override {
                value = static_cast<T>(v);
                return core::success();
            }
            core::VoidResult visitU64(uint64_t v) override {
                value = static_cast<T>(v);
                return core::success();
            }
        } visitor;
        if constexpr (sizeof(T) == 4) {
            GRIDBIND_TRY(d.deserializeF32(visitor));
        } else {
            GRIDBIND_TRY(d.deserializeF64(visitor));
        }
        return visitor.value;
    }
};

template<>
struct Deserialize<std::string> {
    static core::Result<std::string> deserialize(Deserializer& d) {
        struct StringVisitor : Visitor {
            std::string value;
            std::string expecting() const override { return "a string"; }
            core::VoidResult visitStr(std::string_view v) override {
                value.assign(v.data(), v.size());
                return core::success();
            }
        } visitor;
        GRIDBIND_TRY(d.deserializeString(visitor));
        return std::move(visitor.value);
    }
};

/**
 * @brief 单元值：对应完全为空的单元格/行
 */
template<>
struct Deserialize<std::monostate> {
    static core::Result<std::monostate> deserialize(Deserializer& d) {
        struct UnitVisitor : Visitor {
            std::string expecting() const override { return "unit"; }
            core::VoidResult visitUnit() override { return core::success(); }
        } visitor;
        GRIDBIND_TRY(d.deserializeUnit(visitor));
        return std::monostate{};
    }
};

// ========== 复合类型 ==========

template<typename T>
struct Deserialize<std::optional<T>> {
    static core::Result<std::optional<T>> deserialize(Deserializer& d) {
        struct OptionVisitor : Visitor {
            std::optional<T> value;
            std::string expecting() const override { return "option"; }
            core::VoidResult visitNone() override {
                value.reset();
                return core::success();
            }
            core::VoidResult visitUnit() override {
                value.reset();
                return core::success();
            }
            core::VoidResult visitSome(Deserializer& inner) override {
                auto result = Deserialize<T>::deserialize(inner);
                if (result.hasError()) {
                    return std::move(result).error();
                }
                value.emplace(std::move(result).value());
                return core::success();
            }
        } visitor;
        GRIDBIND_TRY(d.deserializeOption(visitor));
        return std::move(visitor.value);
    }
};

template<typename T>
struct Deserialize<std::vector<T>> {
    static core::Result<std::vector<T>> deserialize(Deserializer& d) {
        struct SeqVisitor : Visitor {
            std::vector<T> value;
            std::string expecting() const override { return "a sequence"; }
            core::VoidResult visitSeq(SeqAccess& seq) override {
                if (auto hint = seq.sizeHint()) {
                    value.reserve(*hint);
                }
                while (true) {
                    auto element = nextElement<T>(seq);
                    if (element.hasError()) {
                        return std::move(element).error();
                    }
                    if (!element.value()) {
                        break;
                    }
                    value.push_back(std::move(*element.value()));
                }
                return core::success();
            }
        } visitor;
        GRIDBIND_TRY(d.deserializeSeq(visitor));
        return std::move(visitor.value);
    }
};

/**
 * @brief 有序映射；重复的键以后出现的为准
 */
template<typename K, typename V>
struct Deserialize<std::map<K, V>> {
    static core::Result<std::map<K, V>> deserialize(Deserializer& d) {
        struct MapVisitor : Visitor {
            std::map<K, V> value;
            std::string expecting() const override { return "a map"; }
            core::VoidResult visitMap(MapAccess& map) override {
                while (true) {
                    auto key = nextKey<K>(map);
                    if (key.hasError()) {
                        return std::move(key).error();
                    }
                    if (!key.value()) {
                        break;
                    }
                    auto item = nextValue<V>(map);
                    if (item.hasError()) {
                        return std::move(item).error();
                    }
                    value.insert_or_assign(std::move(*key.value()), std::move(item).value());
                }
                return core::success();
            }
        } visitor;
        GRIDBIND_TRY(d.deserializeMap(visitor));
        return std::move(visitor.value);
    }
};

namespace detail {

template<typename... Ts>
class TupleVisitor : public Visitor {
public:
    std::tuple<Ts...> value;

    std::string expecting() const override {
        return fmt::format("a tuple of size {}", sizeof...(Ts));
    }

    core::VoidResult visitSeq(SeqAccess& seq) override {
        return readFrom<0>(seq);
    }

private:
    template<size_t I>
    core::VoidResult readFrom(SeqAccess& seq) {
        if constexpr (I == sizeof...(Ts)) {
            return core::success();
        } else {
            using Element = std::tuple_element_t<I, std::tuple<Ts...>>;
            auto element = nextElement<Element>(seq);
            if (element.hasError()) {
                return std::move(element).error();
            }
            if (!element.value()) {
                return invalidLength(I);
            }
            std::get<I>(value) = std::move(*element.value());
            return readFrom<I + 1>(seq);
        }
    }
};

} // namespace detail

/**
 * @brief 定长元组，元素类型需可默认构造；元素不足时报 invalid length
 */
template<typename... Ts>
struct Deserialize<std::tuple<Ts...>> {
    static core::Result<std::tuple<Ts...>> deserialize(Deserializer& d) {
        detail::TupleVisitor<Ts...> visitor;
        GRIDBIND_TRY(d.deserializeTuple(sizeof...(Ts), visitor));
        return std::move(visitor.value);
    }
};

/**
 * @brief 吞掉任意值（未知字段使用）
 */
template<>
struct Deserialize<IgnoredAny> {
    static core::Result<IgnoredAny> deserialize(Deserializer& d);
};

template<>
struct Deserialize<Value> {
    static core::Result<Value> deserialize(Deserializer& d);
};

// ========== 用户结构体 ==========

/**
 * @brief 字段绑定：字段名 + 成员指针
 */
template<typename T, typename M>
struct FieldBinding {
    using Owner = T;
    using Member = M;

    std::string_view name;
    M T::*member;
};

template<typename T, typename M>
constexpr FieldBinding<T, M> field(std::string_view name, M T::*member) {
    return FieldBinding<T, M>{name, member};
}

/**
 * @brief 结构体反序列化基类
 *
 * 用法：
 * @code
 * template<>
 * struct gridbind::serde::Deserialize<Person> : gridbind::serde::DeserializeStruct<Person> {
 *     static constexpr std::string_view kName = "Person";
 *     static auto fields() {
 *         return std::make_tuple(field("name", &Person::name),
 *                                field("age", &Person::age));
 *     }
 * };
 * @endcode
 *
 * T 需可默认构造。未知键被忽略；重复键报 duplicate field；
 * 缺失的 std::optional 成员保持为空，其他成员缺失报 missing field。
 * 按位置（序列）解码时依次填充各字段。
 */
template<typename T>
struct DeserializeStruct {
    static core::Result<T> deserialize(Deserializer& d) {
        using Bindings = decltype(Deserialize<T>::fields());

        struct StructVisitor : Visitor {
            T value{};
            Bindings bindings = Deserialize<T>::fields();
            FieldNames names;
            std::vector<bool> seen;

            StructVisitor() {
                detail::forEachIndexed(bindings, [this](size_t, const auto& binding) {
                    names.push_back(binding.name);
                });
                seen.assign(names.size(), false);
            }

            std::string expecting() const override {
                return fmt::format("struct {}", Deserialize<T>::kName);
            }

            core::VoidResult visitMap(MapAccess& map) override {
                detail::IdentifierSeed key_seed(names, false);
                while (true) {
                    auto more = map.nextKeySeed(key_seed);
                    if (more.hasError()) {
                        return std::move(more).error();
                    }
                    if (!more.value()) {
                        break;
                    }

                    const auto& index = key_seed.index();
                    if (!index) {
                        auto ignored = nextValue<IgnoredAny>(map);
                        if (ignored.hasError()) {
                            return std::move(ignored).error();
                        }
                        continue;
                    }
                    if (seen[*index]) {
                        return core::makeCustomError(
                            fmt::format("duplicate field `{}`", names[*index]));
                    }
                    seen[*index] = true;

                    core::VoidResult status = core::success();
                    const size_t target = *index;
                    detail::forEachIndexed(bindings, [&](size_t i, const auto& binding) {
                        if (i != target) {
                            return;
                        }
                        using M = typename std::decay_t<decltype(binding)>::Member;
                        auto item = nextValue<M>(map);
                        if (item.hasError()) {
                            status = std::move(item).error();
                            return;
                        }
                        value.*(binding.member) = std::move(item).value();
                    });
                    if (status.hasError()) {
                        return status;
                    }
                }
                return checkMissing();
            }

            core::VoidResult visitSeq(SeqAccess& seq) override {
                core::VoidResult status = core::success();
                size_t count = 0;
                detail::forEachIndexed(bindings, [&](size_t i, const auto& binding) {
                    if (status.hasError() || count < i) {
                        return;
                    }
                    using M = typename std::decay_t<decltype(binding)>::Member;
                    auto item = nextElement<M>(seq);
                    if (item.hasError()) {
                        status = std::move(item).error();
                        return;
                    }
                    if (!item.value()) {
                        return;
                    }
                    value.*(binding.member) = std::move(*item.value());
                    seen[i] = true;
                    ++count;
                });
                if (status.hasError()) {
                    return status;
                }
                if (count < names.size()) {
                    return invalidLength(count);
                }
                return core::success();
            }

            core::VoidResult checkMissing() {
                core::VoidResult status = core::success();
                detail::forEachIndexed(bindings, [&](size_t i, const auto& binding) {
                    using M = typename std::decay_t<decltype(binding)>::Member;
                    if (seen[i] || detail::IsOptional<M>::value || status.hasError()) {
                        return;
                    }
                    status = core::makeCustomError(fmt::format("missing field `{}`", binding.name));
                });
                return status;
            }
        } visitor;

        GRIDBIND_TRY(d.deserializeStruct(Deserialize<T>::kName, visitor.names, visitor));
        return std::move(visitor.value);
    }
};

// ========== 用户枚举 ==========

/**
 * @brief 单元枚举反序列化基类
 *
 * 用户特化提供 kName 和 variants()，后者返回 (名称, 值) 对：
 * @code
 * static std::vector<std::pair<std::string_view, Color>> variants() {
 *     return {{"Red", Color::Red}, {"Green", Color::Green}};
 * }
 * @endcode
 * 未知名称报 unknown variant；带载荷的变体不受支持。
 */
template<typename T>
struct DeserializeEnum {
    static core::Result<T> deserialize(Deserializer& d) {
        struct EnumVisitor : Visitor {
            std::vector<std::pair<std::string_view, T>> variants = Deserialize<T>::variants();
            FieldNames names;
            std::optional<T> value;

            EnumVisitor() {
                names.reserve(variants.size());
                for (const auto& variant : variants) {
                    names.push_back(variant.first);
                }
            }

            std::string expecting() const override {
                return fmt::format("enum {}", Deserialize<T>::kName);
            }

            core::VoidResult visitEnum(EnumAccess& data) override {
                detail::IdentifierSeed seed(names, true);
                auto access = data.variantSeed(seed);
                if (access.hasError()) {
                    return std::move(access).error();
                }
                if (!seed.index()) {
                    return invalidType("unidentified variant");
                }
                GRIDBIND_TRY(access.value()->unitVariant());
                value = variants[*seed.index()].second;
                return core::success();
            }
        } visitor;

        GRIDBIND_TRY(d.deserializeEnum(Deserialize<T>::kName, visitor.names, visitor));
        if (!visitor.value) {
            return core::makeCustomError(
                fmt::format("invalid type: no variant, expected enum {}", Deserialize<T>::kName));
        }
        return std::move(*visitor.value);
    }
};

}} // namespace gridbind::serde
