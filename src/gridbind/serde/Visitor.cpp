#include "gridbind/serde/Visitor.hpp"
#include <fmt/format.h>

namespace gridbind {
namespace serde {

core::Error Visitor::invalidType(const std::string& unexpected) const {
    return core::makeCustomError(
        fmt::format("invalid type: {}, expected {}", unexpected, expecting()));
}

core::Error Visitor::invalidValue(const std::string& unexpected) const {
    return core::makeCustomError(
        fmt::format("invalid value: {}, expected {}", unexpected, expecting()));
}

core::Error Visitor::invalidLength(size_t length) const {
    return core::makeCustomError(
        fmt::format("invalid length {}, expected {}", length, expecting()));
}

core::VoidResult Visitor::visitBool(bool value) {
    return invalidType(fmt::format("boolean `{}`", value));
}

core::VoidResult Visitor::visitI64(int64_t value) {
    return invalidType(fmt::format("integer `{}`", value));
}

core::VoidResult Visitor::visitU64(uint64_t value) {
    return invalidType(fmt::format("integer `{}`", value));
}

core::VoidResult Visitor::visitF64(double value) {
    return invalidType(fmt::format("floating point `{}`", value));
}

core::VoidResult Visitor::visitStr(std::string_view value) {
    return invalidType(fmt::format("string \"{}\"", value));
}

core::VoidResult Visitor::visitNone() {
    return invalidType("Option value");
}

core::VoidResult Visitor::visitSome(Deserializer& /*deserializer*/) {
    return invalidType("Option value");
}

core::VoidResult Visitor::visitUnit() {
    return invalidType("unit value");
}

core::VoidResult Visitor::visitNewtypeStruct(Deserializer& /*deserializer*/) {
    return invalidType("newtype struct");
}

core::VoidResult Visitor::visitSeq(SeqAccess& /*seq*/) {
    return invalidType("sequence");
}

core::VoidResult Visitor::visitMap(MapAccess& /*map*/) {
    return invalidType("map");
}

core::VoidResult Visitor::visitEnum(EnumAccess& /*data*/) {
    return invalidType("enum");
}

}} // namespace gridbind::serde
