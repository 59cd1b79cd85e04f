#include "drawcast/data_buffer.hpp"

#include <algorithm>
#include <stdexcept>

namespace drawcast {

DataBuffer::DataBuffer(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("DataBuffer: capacity must be > 0");
  }
}

std::size_t DataBuffer::Ingest(const std::vector<OutcomeRecord>& records) {
  std::size_t inserted = 0;
  for (const auto& r : records) {
    // insert() reports whether the id was new, which also covers repeats
    // inside the same batch.
    if (!periods_.insert(r.period_id).second) continue;
    records_.push_front(r);
    ++inserted;
  }

  while (records_.size() > capacity_) {
    periods_.erase(records_.back().period_id);
    records_.pop_back();
  }
  return inserted;
}

bool DataBuffer::Contains(const std::string& period_id) const {
  return periods_.count(period_id) > 0;
}

const OutcomeRecord* DataBuffer::Find(const std::string& period_id) const {
  if (!Contains(period_id)) return nullptr;
  auto it = std::find_if(records_.begin(), records_.end(),
                         [&](const OutcomeRecord& r) {
                           return r.period_id == period_id;
                         });
  return it == records_.end() ? nullptr : &*it;
}

std::vector<int> DataBuffer::Digits(std::size_t n) const {
  const std::size_t k = std::min(n, records_.size());
  std::vector<int> out;
  out.reserve(k);
  for (std::size_t i = 0; i < k; ++i) out.push_back(records_[i].digit);
  return out;
}

std::vector<int> DataBuffer::Bits(std::size_t n) const {
  const std::size_t k = std::min(n, records_.size());
  std::vector<int> out;
  out.reserve(k);
  for (std::size_t i = 0; i < k; ++i) out.push_back(records_[i].bit);
  return out;
}

}  // namespace drawcast
