#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace customize {

enum class ChangeKind { Color, Typography, Layout, Section, Role, Reset, Import };

const char* change_kind_str(ChangeKind k);
std::optional<ChangeKind> parse_change_kind(const std::string& s);

struct CustomizationChange {
    ChangeKind kind = ChangeKind::Color;
    std::string property;
    nlohmann::json previous_value;
    nlohmann::json new_value;
    std::string timestamp;
    nlohmann::json metadata;

    nlohmann::json to_json() const;
    static CustomizationChange from_json(const nlohmann::json& j, const std::string& where);
};

// Fixed-capacity ring buffer; pushing onto a full buffer drops the oldest entry.
class ChangeHistory {
public:
    static constexpr size_t kDefaultCapacity = 50;

    explicit ChangeHistory(size_t capacity = kDefaultCapacity);

    void push(CustomizationChange change);
    std::optional<CustomizationChange> pop_latest();
    const CustomizationChange* latest() const;
    void clear();

    size_t size() const { return size_; }
    size_t capacity() const { return slots_.size(); }
    bool empty() const { return size_ == 0; }

    // Oldest first.
    std::vector<CustomizationChange> entries() const;

    nlohmann::json to_json() const;

private:
    std::vector<CustomizationChange> slots_;
    size_t head_ = 0; // index of the oldest entry
    size_t size_ = 0;
};

} // namespace customize
