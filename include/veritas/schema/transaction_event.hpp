#pragma once

#include <veritas/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Schema type: transaction event.
// Emitted by the registry for off-chain indexing and auditing.
namespace veritas::schema {

inline constexpr auto kHashAddedEventType = std::string_view{"HashAdded"};

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

}  // namespace veritas::schema
