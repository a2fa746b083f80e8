#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "cmdai/types.hpp"

namespace cmdai {

class HistoryStore {
 public:
  explicit HistoryStore(std::string historyPath);

  void load();

  const std::vector<HistoryEntry>& list() const;
  std::vector<HistoryEntry> recent(std::size_t count) const;

  // The entry stays in memory even when the rewrite fails with PersistenceError.
  void append(HistoryEntry entry);
  void clear();

  const std::string& path() const;

  static long long now_epoch();
  static std::string format_timestamp(long long epoch);
  static long long parse_timestamp(const std::string& value);

 private:
  std::string m_historyPath;
  std::vector<HistoryEntry> m_entries;

  void persist() const;
};

}  // namespace cmdai
