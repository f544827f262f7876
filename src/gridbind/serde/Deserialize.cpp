#include "gridbind/serde/Deserialize.hpp"

namespace gridbind {
namespace serde {

namespace detail {

std::string joinNames(const FieldNames& names) {
    std::string joined;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += fmt::format("`{}`", names[i]);
    }
    return joined;
}

core::VoidResult IdentifierSeed::visitStr(std::string_view value) {
    for (size_t i = 0; i < names_.size(); ++i) {
        if (names_[i] == value) {
            index_ = i;
            return core::success();
        }
    }
    if (!reject_unknown_) {
        return core::success();
    }
    if (names_.empty()) {
        return core::makeCustomError(
            fmt::format("unknown variant `{}`, there are no variants", value));
    }
    return core::makeCustomError(
        fmt::format("unknown variant `{}`, expected one of {}", value, joinNames(names_)));
}

core::VoidResult IdentifierSeed::visitU64(uint64_t value) {
    if (value < names_.size()) {
        index_ = static_cast<size_t>(value);
        return core::success();
    }
    if (!reject_unknown_) {
        return core::success();
    }
    return core::makeCustomError(fmt::format(
        "invalid value: integer `{}`, expected variant index 0 <= i < {}", value, names_.size()));
}

} // namespace detail

// ========== IgnoredAny ==========

namespace {

class IgnoredAnyVisitor : public Visitor {
public:
    std::string expecting() const override { return "anything at all"; }

    core::VoidResult visitBool(bool) override { return core::success(); }
    core::VoidResult visitI64(int64_t) override { return core::success(); }
    core::VoidResult visitU64(uint64_t) override { return core::success(); }
    core::VoidResult visitF64(double) override { return core::success(); }
    core::VoidResult visitStr(std::string_view) override { return core::success(); }
    core::VoidResult visitNone() override { return core::success(); }
    core::VoidResult visitUnit() override { return core::success(); }

    core::VoidResult visitSome(Deserializer& deserializer) override {
        GRIDBIND_TRY(Deserialize<IgnoredAny>::deserialize(deserializer));
        return core::success();
    }

    core::VoidResult visitNewtypeStruct(Deserializer& deserializer) override {
        GRIDBIND_TRY(Deserialize<IgnoredAny>::deserialize(deserializer));
        return core::success();
    }

    core::VoidResult visitSeq(SeqAccess& seq) override {
        while (true) {
            auto element = nextElement<IgnoredAny>(seq);
            if (element.hasError()) {
                return std::move(element).error();
            }
            if (!element.value()) {
                return core::success();
            }
        }
    }

    core::VoidResult visitMap(MapAccess& map) override {
        while (true) {
            auto key = nextKey<IgnoredAny>(map);
            if (key.hasError()) {
                return std::move(key).error();
            }
            if (!key.value()) {
                return core::success();
            }
            GRIDBIND_TRY(nextValue<IgnoredAny>(map));
        }
    }

    core::VoidResult visitEnum(EnumAccess& data) override {
        TypedSeed<IgnoredAny> tag;
        auto access = data.variantSeed(tag);
        if (access.hasError()) {
            return std::move(access).error();
        }
        return access.value()->unitVariant();
    }
};

// ========== Value ==========

class ValueVisitor : public Visitor {
public:
    Value value;

    std::string expecting() const override { return "any valid value"; }

    core::VoidResult visitBool(bool v) override {
        value = Value(v);
        return core::success();
    }

    core::VoidResult visitI64(int64_t v) override {
        value = Value(static_cast<double>(v));
        return core::success();
    }

    core::VoidResult visitU64(uint64_t v) override {
        value = Value(static_cast<double>(v));
        return core::success();
    }

    core::VoidResult visitF64(double v) override {
        value = Value(v);
        return core::success();
    }

    core::VoidResult visitStr(std::string_view v) override {
        value = Value(std::string(v));
        return core::success();
    }

    core::VoidResult visitNone() override {
        value = Value::null();
        return core::success();
    }

    core::VoidResult visitUnit() override {
        value = Value::null();
        return core::success();
    }

    core::VoidResult visitSome(Deserializer& deserializer) override {
        return readInner(deserializer);
    }

    core::VoidResult visitNewtypeStruct(Deserializer& deserializer) override {
        return readInner(deserializer);
    }

    core::VoidResult visitSeq(SeqAccess& seq) override {
        Value::Array items;
        while (true) {
            auto element = nextElement<Value>(seq);
            if (element.hasError()) {
                return std::move(element).error();
            }
            if (!element.value()) {
                break;
            }
            items.push_back(std::move(*element.value()));
        }
        value = Value(std::move(items));
        return core::success();
    }

    core::VoidResult visitMap(MapAccess& map) override {
        Value::Object entries;
        while (true) {
            auto key = nextKey<std::string>(map);
            if (key.hasError()) {
                return std::move(key).error();
            }
            if (!key.value()) {
                break;
            }
            auto item = nextValue<Value>(map);
            if (item.hasError()) {
                return std::move(item).error();
            }
            entries.emplace_back(std::move(*key.value()), std::move(item).value());
        }
        value = Value(std::move(entries));
        return core::success();
    }

private:
    core::VoidResult readInner(Deserializer& deserializer) {
        auto inner = Deserialize<Value>::deserialize(deserializer);
        if (inner.hasError()) {
            return std::move(inner).error();
        }
        value = std::move(inner).value();
        return core::success();
    }
};

} // namespace

core::Result<IgnoredAny> Deserialize<IgnoredAny>::deserialize(Deserializer& d) {
    IgnoredAnyVisitor visitor;
    GRIDBIND_TRY(d.deserializeIgnoredAny(visitor));
    return IgnoredAny{};
}

core::Result<Value> Deserialize<Value>::deserialize(Deserializer& d) {
    ValueVisitor visitor;
    GRIDBIND_TRY(d.deserializeAny(visitor));
    return std::move(visitor.value);
}

}} // namespace gridbind::serde
