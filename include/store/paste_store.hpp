#pragma once

#include <cstdint>
#include <deque>
#include <list>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace pastebin {
namespace store {

using Bytes = std::vector<std::uint8_t>;

// A stored paste. Never mutated after insertion.
struct Paste {
  Bytes content;
  std::string device_code;
};

class PasteStore {
public:
  static constexpr std::size_t DEFAULT_DEVICE_PASTE_LIMIT = 2;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit PasteStore(std::size_t device_paste_limit = DEFAULT_DEVICE_PASTE_LIMIT);

  PasteStore(const PasteStore&) = delete;
  PasteStore& operator=(const PasteStore&) = delete;


  // ---- CORE STORAGE OPERATIONS ----
  // Stores a paste under id for the device, evicting the device's oldest
  // pastes first. An id that is already live is replaced.
  void insert(const std::string& id, Bytes content, const std::string& device_code);
  // Same as insert, but leaves the store untouched and returns false if id is live
  bool try_insert(const std::string& id, Bytes content, const std::string& device_code);
  // Returns the content only if id exists and belongs to the device
  std::optional<Bytes> lookup(const std::string& id, const std::string& device_code) const;


  // ---- QUERY OPERATIONS ----
  // Ids owned by the device, most recently inserted first
  std::vector<std::string> list_ids(const std::string& device_code) const;
  // Distinct device codes owning at least one live paste
  std::unordered_set<std::string> known_owners() const;
  std::size_t size() const;
  std::size_t device_paste_limit() const { return device_paste_limit_; }

private:
  using Entry = std::pair<std::string, Paste>;

  // ---- PARAMETERS ----
  const std::size_t device_paste_limit_;

  // Insertion order, oldest first
  std::list<Entry> entries_;
  std::unordered_map<std::string, std::list<Entry>::iterator> index_;
  // Ids per device, oldest first
  std::unordered_map<std::string, std::deque<std::string>> device_index_;

  mutable std::shared_mutex mutex_;


  // ---- EVICTION SUPPORT ----
  // Caller must hold the exclusive lock for all of these
  // Appends the entry as the newest one; eviction has already run
  void insert_locked(const std::string& id, Bytes content, const std::string& device_code);
  // Removes the device's oldest pastes until one slot is free
  void purge_device_old(const std::string& device_code);
  void erase_entry(const std::string& id);
};

} // namespace store
} // namespace pastebin
