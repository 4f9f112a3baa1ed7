#include "customize/ChangeHistory.hpp"

#include "io/JsonRequire.hpp"

#include <stdexcept>

namespace customize {

const char* change_kind_str(ChangeKind k) {
    switch (k) {
        case ChangeKind::Color: return "color";
        case ChangeKind::Typography: return "typography";
        case ChangeKind::Layout: return "layout";
        case ChangeKind::Section: return "section";
        case ChangeKind::Role: return "role";
        case ChangeKind::Reset: return "reset";
        case ChangeKind::Import: return "import";
    }
    return "color";
}

std::optional<ChangeKind> parse_change_kind(const std::string& s) {
    for (ChangeKind k : {ChangeKind::Color, ChangeKind::Typography, ChangeKind::Layout, ChangeKind::Section,
                         ChangeKind::Role, ChangeKind::Reset, ChangeKind::Import}) {
        if (s == change_kind_str(k)) return k;
    }
    return std::nullopt;
}

nlohmann::json CustomizationChange::to_json() const {
    nlohmann::json j;
    j["type"] = change_kind_str(kind);
    j["property"] = property;
    j["previousValue"] = previous_value;
    j["newValue"] = new_value;
    j["timestamp"] = timestamp;
    if (!metadata.is_null()) j["metadata"] = metadata;
    return j;
}

CustomizationChange CustomizationChange::from_json(const nlohmann::json& j, const std::string& where) {
    io::detail::require_object(j, where);

    const std::string type = io::detail::require_string(j, "type", where);
    auto kind = parse_change_kind(type);
    if (!kind) {
        throw std::runtime_error(where + ".type has unknown value: " + type);
    }

    CustomizationChange c;
    c.kind = *kind;
    c.property = io::detail::optional_string(j, "property", where);
    c.previous_value = j.value("previousValue", nlohmann::json());
    c.new_value = j.value("newValue", nlohmann::json());
    c.timestamp = io::detail::optional_string(j, "timestamp", where);
    c.metadata = j.value("metadata", nlohmann::json());
    return c;
}

ChangeHistory::ChangeHistory(size_t capacity) : slots_(capacity == 0 ? 1 : capacity) {}

void ChangeHistory::push(CustomizationChange change) {
    const size_t cap = slots_.size();
    if (size_ < cap) {
        slots_[(head_ + size_) % cap] = std::move(change);
        ++size_;
    } else {
        slots_[head_] = std::move(change);
        head_ = (head_ + 1) % cap;
    }
}

std::optional<CustomizationChange> ChangeHistory::pop_latest() {
    if (size_ == 0) return std::nullopt;
    const size_t idx = (head_ + size_ - 1) % slots_.size();
    CustomizationChange out = std::move(slots_[idx]);
    slots_[idx] = CustomizationChange{};
    --size_;
    return out;
}

const CustomizationChange* ChangeHistory::latest() const {
    if (size_ == 0) return nullptr;
    return &slots_[(head_ + size_ - 1) % slots_.size()];
}

void ChangeHistory::clear() {
    for (auto& s : slots_) s = CustomizationChange{};
    head_ = 0;
    size_ = 0;
}

std::vector<CustomizationChange> ChangeHistory::entries() const {
    std::vector<CustomizationChange> out;
    out.reserve(size_);
    for (size_t i = 0; i < size_; ++i) {
        out.push_back(slots_[(head_ + i) % slots_.size()]);
    }
    return out;
}

nlohmann::json ChangeHistory::to_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& c : entries()) arr.push_back(c.to_json());
    return arr;
}

} // namespace customize
