/**
 * @file Visitor.hpp
 * @brief 解码协议：访问者、反序列化器以及结构访问接口
 *
 * 目标类型通过 Visitor 声明自己能接受的形态，Deserializer 负责
 * 从具体数据源回答请求。所有方法都返回 Result/VoidResult，不抛异常。
 */

#pragma once

#include "gridbind/core/Expected.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gridbind {
namespace serde {

class Deserializer;
class SeqAccess;
class MapAccess;
class EnumAccess;

using FieldNames = std::vector<std::string_view>;

/**
 * @brief 值的消费者
 *
 * 每个 visitXxx 对应数据源能提供的一种形态。未覆盖的方法返回
 * Custom 错误 "invalid type: ..., expected <expecting()>"。
 * 访问者把结果保存在自己的成员中。
 */
class Visitor {
public:
    virtual ~Visitor() = default;

    /**
     * @brief 期望的形态描述，用于错误消息（如 "a boolean"）
     */
    virtual std::string expecting() const = 0;

    virtual core::VoidResult visitBool(bool value);

    // 窄整数默认转发到 64 位版本
    virtual core::VoidResult visitI8(int8_t value) { return visitI64(value); }
    virtual core::VoidResult visitI16(int16_t value) { return visitI64(value); }
    virtual core::VoidResult visitI32(int32_t value) { return visitI64(value); }
    virtual core::VoidResult visitI64(int64_t value);

    virtual core::VoidResult visitU8(uint8_t value) { return visitU64(value); }
    virtual core::VoidResult visitU16(uint16_t value) { return visitU64(value); }
    virtual core::VoidResult visitU32(uint32_t value) { return visitU64(value); }
    virtual core::VoidResult visitU64(uint64_t value);

    virtual core::VoidResult visitF32(float value) { return visitF64(value); }
    virtual core::VoidResult visitF64(double value);

    /**
     * @brief 字符串视图只在本次调用期间有效，需要保留时自行拷贝
     */
    virtual core::VoidResult visitStr(std::string_view value);

    virtual core::VoidResult visitNone();
    virtual core::VoidResult visitSome(Deserializer& deserializer);
    virtual core::VoidResult visitUnit();
    virtual core::VoidResult visitNewtypeStruct(Deserializer& deserializer);
    virtual core::VoidResult visitSeq(SeqAccess& seq);
    virtual core::VoidResult visitMap(MapAccess& map);
    virtual core::VoidResult visitEnum(EnumAccess& data);

protected:
    /**
     * @brief 构造 "invalid type" 错误
     * @param unexpected 实际遇到的形态描述
     */
    core::Error invalidType(const std::string& unexpected) const;

    /**
     * @brief 构造 "invalid value" 错误
     */
    core::Error invalidValue(const std::string& unexpected) const;

    /**
     * @brief 构造 "invalid length" 错误
     */
    core::Error invalidLength(size_t length) const;
};

/**
 * @brief 种子：携带状态的反序列化目标
 */
class DeserializeSeed {
public:
    virtual ~DeserializeSeed() = default;
    virtual core::VoidResult deserialize(Deserializer& deserializer) = 0;
};

/**
 * @brief 值的来源
 *
 * 每个请求都是目标类型给出的形态提示。未覆盖的请求默认转发到
 * deserializeAny，由数据源自行决定形态。
 */
class Deserializer {
public:
    virtual ~Deserializer() = default;

    virtual core::VoidResult deserializeAny(Visitor& visitor) = 0;

    virtual core::VoidResult deserializeBool(Visitor& visitor) { return deserializeAny(visitor); }
    virtual core::VoidResult deserializeI8(Visitor& visitor) { return deserializeAny(visitor); }
    virtual core::VoidResult deserializeI16(Visitor& visitor) { return deserializeAny(visitor); }
    virtual core::VoidResult deserializeI32(Visitor& visitor) { return deserializeAny(visitor); }
    virtual core::VoidResult deserializeI64(Visitor& visitor) { return deserializeAny(visitor); }
    virtual core::VoidResult deserializeU8(Visitor& visitor) { return deserializeAny(visitor); }
    virtual core::VoidResult deserializeU16(Visitor& visitor) { return deserializeAny(visitor); }
    virtual core::VoidResult deserializeU32(Visitor& visitor) { return deserializeAny(visitor); }
    virtual core::VoidResult deserializeU64(Visitor& visitor) { return deserializeAny(visitor); }
    virtual core::VoidResult deserializeF32(Visitor& visitor) { return deserializeAny(visitor); }
    virtual core::VoidResult deserializeF64(Visitor& visitor) { return deserializeAny(visitor); }
    virtual core::VoidResult deserializeStr(Visitor& visitor) { return deserializeAny(visitor); }
    virtual core::VoidResult deserializeString(Visitor& visitor) { return deserializeStr(visitor); }
    virtual core::VoidResult deserializeOption(Visitor& visitor) { return deserializeAny(visitor); }
    virtual core::VoidResult deserializeUnit(Visitor& visitor) { return deserializeAny(visitor); }

    virtual core::VoidResult deserializeUnitStruct(std::string_view /*name*/, Visitor& visitor) {
        return deserializeUnit(visitor);
    }
    virtual core::VoidResult deserializeNewtypeStruct(std::string_view /*name*/, Visitor& visitor) {
        return visitor.visitNewtypeStruct(*this);
    }

    virtual core::VoidResult deserializeSeq(Visitor& visitor) { return deserializeAny(visitor); }
    virtual core::VoidResult deserializeTuple(size_t /*len*/, Visitor& visitor) {
        return deserializeSeq(visitor);
    }
    virtual core::VoidResult deserializeTupleStruct(std::string_view /*name*/, size_t len, Visitor& visitor) {
        return deserializeTuple(len, visitor);
    }

    virtual core::VoidResult deserializeMap(Visitor& visitor) { return deserializeAny(visitor); }
    virtual core::VoidResult deserializeStruct(std::string_view /*name*/, const FieldNames& /*fields*/,
                                               Visitor& visitor) {
        return deserializeMap(visitor);
    }
    virtual core::VoidResult deserializeEnum(std::string_view /*name*/, const FieldNames& /*variants*/,
                                             Visitor& visitor) {
        return deserializeAny(visitor);
    }

    /**
     * @brief 字段名或变体名
     */
    virtual core::VoidResult deserializeIdentifier(Visitor& visitor) { return deserializeStr(visitor); }

    /**
     * @brief 读取并丢弃一个值
     */
    virtual core::VoidResult deserializeIgnoredAny(Visitor& visitor) { return deserializeAny(visitor); }
};

/**
 * @brief 序列访问
 */
class SeqAccess {
public:
    virtual ~SeqAccess() = default;

    /**
     * @brief 读取下一个元素
     * @return true 已读取；false 序列结束
     */
    virtual core::Result<bool> nextElementSeed(DeserializeSeed& seed) = 0;

    virtual std::optional<size_t> sizeHint() const { return std::nullopt; }
};

/**
 * @brief 映射访问：nextKeySeed 与 nextValueSeed 必须成对调用
 */
class MapAccess {
public:
    virtual ~MapAccess() = default;

    /**
     * @return true 已读取键；false 映射结束
     */
    virtual core::Result<bool> nextKeySeed(DeserializeSeed& seed) = 0;
    virtual core::VoidResult nextValueSeed(DeserializeSeed& seed) = 0;

    virtual std::optional<size_t> sizeHint() const { return std::nullopt; }
};

/**
 * @brief 枚举变体载荷访问
 */
class VariantAccess {
public:
    virtual ~VariantAccess() = default;

    virtual core::VoidResult unitVariant() = 0;
    virtual core::VoidResult newtypeVariantSeed(DeserializeSeed& seed) = 0;
    virtual core::VoidResult tupleVariant(size_t len, Visitor& visitor) = 0;
    virtual core::VoidResult structVariant(const FieldNames& fields, Visitor& visitor) = 0;
};

/**
 * @brief 枚举访问
 */
class EnumAccess {
public:
    virtual ~EnumAccess() = default;

    /**
     * @brief 用 seed 读取变体标签
     * @return 载荷访问对象，由 EnumAccess 持有，生命周期不超过本次 visitEnum
     */
    virtual core::Result<VariantAccess*> variantSeed(DeserializeSeed& seed) = 0;
};

}} // namespace gridbind::serde
