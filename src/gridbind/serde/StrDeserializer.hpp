#pragma once

#include "gridbind/serde/Visitor.hpp"
#include <string_view>

namespace gridbind {
namespace serde {

/**
 * @brief 单个借用字符串上的反序列化器
 *
 * 用于映射键：键总是以字符串形式交给访问者，也可以作为单元枚举变体名。
 * 被借用的字符串必须比反序列化器活得更久。
 */
class StrDeserializer : public Deserializer,
                        private EnumAccess,
                        private VariantAccess {
public:
    explicit StrDeserializer(std::string_view value) : value_(value) {}

    core::VoidResult deserializeAny(Visitor& visitor) override;
    core::VoidResult deserializeEnum(std::string_view name, const FieldNames& variants,
                                     Visitor& visitor) override;

    std::string_view value() const { return value_; }

private:
    // EnumAccess
    core::Result<VariantAccess*> variantSeed(DeserializeSeed& seed) override;

    // VariantAccess：字符串只能表示单元变体
    core::VoidResult unitVariant() override;
    core::VoidResult newtypeVariantSeed(DeserializeSeed& seed) override;
    core::VoidResult tupleVariant(size_t len, Visitor& visitor) override;
    core::VoidResult structVariant(const FieldNames& fields, Visitor& visitor) override;

    std::string_view value_;
};

}} // namespace gridbind::serde
