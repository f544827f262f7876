#include "gridbind/serde/StrDeserializer.hpp"

namespace gridbind {
namespace serde {

core::VoidResult StrDeserializer::deserializeAny(Visitor& visitor) {
    return visitor.visitStr(value_);
}

core::VoidResult StrDeserializer::deserializeEnum(std::string_view /*name*/,
                                                  const FieldNames& /*variants*/,
                                                  Visitor& visitor) {
    return visitor.visitEnum(*this);
}

core::Result<VariantAccess*> StrDeserializer::variantSeed(DeserializeSeed& seed) {
    GRIDBIND_TRY(seed.deserialize(*this));
    return static_cast<VariantAccess*>(this);
}

core::VoidResult StrDeserializer::unitVariant() {
    return core::success();
}

core::VoidResult StrDeserializer::newtypeVariantSeed(DeserializeSeed& /*seed*/) {
    return core::makeCustomError("invalid type: unit variant, expected newtype variant");
}

core::VoidResult StrDeserializer::tupleVariant(size_t /*len*/, Visitor& /*visitor*/) {
    return core::makeCustomError("invalid type: unit variant, expected tuple variant");
}

core::VoidResult StrDeserializer::structVariant(const FieldNames& /*fields*/, Visitor& /*visitor*/) {
    return core::makeCustomError("invalid type: unit variant, expected struct variant");
}

}} // namespace gridbind::serde
