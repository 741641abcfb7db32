#ifndef _SPLITFILE_API_FILE_STORAGE_H
#define _SPLITFILE_API_FILE_STORAGE_H

#include <memory>
#include "splitfile/Common.hpp"
#include "splitfile/Defs.hpp"
#include "splitfile/IStorage.hpp"
#include "splitfile/IVolumeStore.hpp"

namespace splitfile
{

// Volumes are regular files, volume names are paths
SPLITFILE_API_DECL std::shared_ptr<IVolumeStore> OpenFileVolumeStore();

SPLITFILE_API_DECL std::unique_ptr<IStorage> OpenFileStorage(const char * fileName, OpenMode = OpenMode::ReadWrite, bool create = false);

}

#endif
