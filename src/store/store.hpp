#ifndef SKULD_STORE_HPP
#define SKULD_STORE_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/key.hpp"
#include "details/backend.hpp"
#include "details/artifact_store.hpp"

namespace Skuld::Store {
    using ArtifactKey = Details::ArtifactKey;
    using KeyLock = Details::KeyLock;
    using StorageBackend = Details::StorageBackend;
    using FilesystemBackend = Details::FilesystemBackend;
    using MemoryBackend = Details::MemoryBackend;
    using SaveMode = Details::SaveMode;
    using ArtifactStore = Details::ArtifactStore;

    using Details::kMetadataFile;
    using Details::kParametersFile;
    using Details::make_key;
    using Details::validate;
}

#endif // SKULD_STORE_HPP
