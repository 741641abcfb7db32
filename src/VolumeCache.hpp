#pragma once

#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include "splitfile/IStorage.hpp"

namespace splitfile
{

// Open volume handles keyed by volume index, at most one per volume.
// With non-zero limit, least recently used handle is flushed and closed
// before a new one is opened.
class VolumeCache
{
public:
  typedef std::function<std::unique_ptr<IStorage>()> OpenFunc_t;

  explicit VolumeCache(size_t limit);

  VolumeCache(VolumeCache const &) = delete;
  void operator=(VolumeCache const &) = delete;

  IStorage & acquire(uint64_t index, OpenFunc_t const & open);
  IStorage * find(uint64_t index);

  void release(uint64_t index);
  void flushAll();
  // Every handle is released even if some flush fails, first error is rethrown afterwards
  void releaseAll();

  size_t openCount() const { return m_handles.size(); }
  bool contains(uint64_t index) const { return m_handles.count(index) != 0; }

private:
  typedef std::list<uint64_t> UsageList_t; // front - most recently used

  struct Entry
  {
    std::unique_ptr<IStorage> storage;
    UsageList_t::iterator usage;
  };

  size_t const m_limit;
  std::map<uint64_t, Entry> m_handles;
  UsageList_t m_usage;

  void evictLeastRecentlyUsed();
};

}
