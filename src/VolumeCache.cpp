#include "VolumeCache.hpp"
#include <boost/log/trivial.hpp>
#include <boost/optional.hpp>
#include "splitfile/SplitFileError.hpp"
#include "util/Assert.hpp"

namespace splitfile
{

VolumeCache::VolumeCache(size_t limit)
  : m_limit(limit)
{}

IStorage & VolumeCache::acquire(uint64_t index, OpenFunc_t const & open)
{
  auto it = m_handles.find(index);
  if (it != m_handles.end())
  {
    m_usage.splice(m_usage.begin(), m_usage, it->second.usage);
    return *it->second.storage;
  }

  if (m_limit != UnboundedHandleCache && m_handles.size() >= m_limit)
    evictLeastRecentlyUsed();

  std::unique_ptr<IStorage> storage = open();
  SPLITFILE_ASSERT(storage);
  m_usage.push_front(index);
  Entry & entry = m_handles[index];
  entry.storage = std::move(storage);
  entry.usage = m_usage.begin();
  return *entry.storage;
}

IStorage * VolumeCache::find(uint64_t index)
{
  auto it = m_handles.find(index);
  return it == m_handles.end() ? nullptr : it->second.storage.get();
}

void VolumeCache::release(uint64_t index)
{
  auto it = m_handles.find(index);
  if (it == m_handles.end())
    return;
  it->second.storage->flush();
  m_usage.erase(it->second.usage);
  m_handles.erase(it);
}

void VolumeCache::flushAll()
{
  for (auto & handle : m_handles)
    handle.second.storage->flush();
}

void VolumeCache::releaseAll()
{
  boost::optional<SplitFileError> firstError;
  for (auto & handle : m_handles)
  {
    try
    {
      handle.second.storage->flush();
    }
    catch (SplitFileError const & e)
    {
      BOOST_LOG_TRIVIAL(error) << "VolumeCache: Flush of volume " << handle.first << " failed: " << e.message();
      if (!firstError)
        firstError = e;
    }
  }
  m_handles.clear();
  m_usage.clear();
  if (firstError)
    throw *firstError;
}

void VolumeCache::evictLeastRecentlyUsed()
{
  SPLITFILE_ASSERT(!m_usage.empty());
  uint64_t const index = m_usage.back();
  BOOST_LOG_TRIVIAL(debug) << "VolumeCache: Closing least recently used volume " << index
    << " (limit " << m_limit << " handles)";
  release(index);
}

}
