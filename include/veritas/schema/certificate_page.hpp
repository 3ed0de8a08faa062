#pragma once
#include <veritas/schema/certificate_record.hpp>
#include <veritas/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace veritas::schema {

template <uint16_t Version>
struct listed_certificate;

template <>
struct listed_certificate<1> final {
  uint16_t version{1};
  certificate_record_t record;
  std::optional<transaction_id_t> transaction_id;
};

using listed_certificate_t = listed_certificate<1>;

template <uint16_t Version>
struct certificate_page;

// One page of an institution's records, newest first. `total` counts every
// record of the institution, not just this page.
template <>
struct certificate_page<1> final {
  uint16_t version{1};
  std::vector<listed_certificate_t> certificates;
  uint32_t page{1};
  uint32_t limit{10};
  uint64_t total{};
};

using certificate_page_t = certificate_page<1>;

inline uint64_t total_pages(const certificate_page_t& page) {
  return page.limit == 0 ? 0 : (page.total + page.limit - 1) / page.limit;
}

}  // namespace veritas::schema
