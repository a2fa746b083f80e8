#include "cmdai/history_store.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>

#include "cmdai/errors.hpp"
#include "cmdai/json_file.hpp"
#include "cmdai/log.hpp"

namespace cmdai {
namespace {

constexpr const char* kTimestampFormat = "%Y-%m-%dT%H:%M:%SZ";

std::optional<HistoryEntry> entry_from_json(const nlohmann::json& item) {
  if (!item.is_object()) {
    return std::nullopt;
  }
  const auto query = item.find("query");
  const auto response = item.find("response");
  if (query == item.end() || response == item.end() || !query->is_string() || !response->is_string()) {
    return std::nullopt;
  }

  HistoryEntry entry;
  entry.m_query = query->get<std::string>();
  entry.m_response = response->get<std::string>();
  if (const auto ts = item.find("timestamp"); ts != item.end()) {
    if (ts->is_string()) {
      entry.m_timestamp = HistoryStore::parse_timestamp(ts->get<std::string>());
    } else if (ts->is_number_integer()) {
      entry.m_timestamp = ts->get<long long>();
    }
  }
  return entry;
}

}  // namespace

HistoryStore::HistoryStore(std::string historyPath) : m_historyPath(std::move(historyPath)) {}

void HistoryStore::load() {
  m_entries.clear();

  std::optional<nlohmann::json> document;
  try {
    document = read_json_file(m_historyPath);
  } catch (const nlohmann::json::parse_error& ex) {
    log_warn("ignoring unreadable history " + m_historyPath + ": " + ex.what());
    return;
  } catch (const PersistenceError& ex) {
    log_warn(std::string("ignoring history: ") + ex.what());
    return;
  }

  if (!document.has_value()) {
    return;
  }
  if (!document->is_array()) {
    log_warn("ignoring history " + m_historyPath + ": not a JSON array");
    return;
  }

  std::size_t skipped = 0;
  for (const auto& item : *document) {
    if (std::optional<HistoryEntry> entry = entry_from_json(item); entry.has_value()) {
      m_entries.push_back(std::move(*entry));
    } else {
      ++skipped;
    }
  }
  if (skipped > 0) {
    log_warn("skipped " + std::to_string(skipped) + " malformed history entries in " + m_historyPath);
  }
}

const std::vector<HistoryEntry>& HistoryStore::list() const { return m_entries; }

std::vector<HistoryEntry> HistoryStore::recent(std::size_t count) const {
  if (count >= m_entries.size()) {
    return m_entries;
  }
  return std::vector<HistoryEntry>(m_entries.end() - static_cast<std::ptrdiff_t>(count), m_entries.end());
}

void HistoryStore::append(HistoryEntry entry) {
  if (entry.m_timestamp == 0) {
    entry.m_timestamp = now_epoch();
  }
  m_entries.push_back(std::move(entry));
  persist();
}

void HistoryStore::clear() {
  m_entries.clear();
  persist();
}

const std::string& HistoryStore::path() const { return m_historyPath; }

long long HistoryStore::now_epoch() {
  const auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

std::string HistoryStore::format_timestamp(long long epoch) {
  const std::time_t raw = static_cast<std::time_t>(epoch);
  std::tm tm{};
  gmtime_r(&raw, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, kTimestampFormat);
  return out.str();
}

long long HistoryStore::parse_timestamp(const std::string& value) {
  std::tm tm{};
  std::istringstream in(value);
  in >> std::get_time(&tm, kTimestampFormat);
  if (in.fail()) {
    return 0;
  }
  return static_cast<long long>(timegm(&tm));
}

void HistoryStore::persist() const {
  nlohmann::json document = nlohmann::json::array();
  for (const auto& entry : m_entries) {
    document.push_back({{"timestamp", format_timestamp(entry.m_timestamp)},
                        {"query", entry.m_query},
                        {"response", entry.m_response}});
  }
  write_json_file(m_historyPath, document);
}

}  // namespace cmdai
