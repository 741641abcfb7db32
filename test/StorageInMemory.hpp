#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "splitfile/IStorage.hpp"
#include "splitfile/IVolumeStore.hpp"

class VolumeStoreInMemory;

class StorageInMemory: public splitfile::IStorage
{
public:
  StorageInMemory(VolumeStoreInMemory & store, std::string const & name,
    std::shared_ptr<std::vector<char>> const & data, splitfile::OpenMode mode);
  ~StorageInMemory();

  uint64_t size() const override { return m_data->size(); }
  size_t read(uint64_t position, size_t size, void *) const override;
  void write(uint64_t position, size_t size, void const *) override;
  void resize(uint64_t size) override;
  void flush() override;

private:
  VolumeStoreInMemory & m_store;
  std::string const m_name;
  std::shared_ptr<std::vector<char>> m_data;
  splitfile::OpenMode m_mode;
};

class VolumeStoreInMemory: public splitfile::IVolumeStore
{
public:
  std::unique_ptr<splitfile::IStorage> open(std::string const & name, splitfile::OpenMode openMode, bool create) override;
  bool exists(std::string const & name) const override;
  void remove(std::string const & name) override;

  std::vector<char> & data(std::string const & name);
  void put(std::string const & name, std::vector<char> const & data);

  // Failure injection
  void denyAccess(std::string const & name) { m_denied.insert(name); }
  void failWrites(std::string const & name) { m_failingWrites.insert(name); }
  void failFlushes(std::string const & name) { m_failingFlushes.insert(name); }

  bool failsWrites(std::string const & name) const { return m_failingWrites.count(name) != 0; }
  bool failsFlushes(std::string const & name) const { return m_failingFlushes.count(name) != 0; }

  size_t volumeCount() const { return m_volumes.size(); }
  unsigned openHandles() const { return m_openHandles; }
  unsigned maxOpenHandles() const { return m_maxOpenHandles; }
  unsigned flushCount() const { return m_flushCount; }

private:
  friend class StorageInMemory;

  std::map<std::string, std::shared_ptr<std::vector<char>>> m_volumes;
  std::set<std::string> m_denied;
  std::set<std::string> m_failingWrites;
  std::set<std::string> m_failingFlushes;
  unsigned m_openHandles = 0;
  unsigned m_maxOpenHandles = 0;
  unsigned m_flushCount = 0;
};
