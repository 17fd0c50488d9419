#pragma once

#include <cstdint>
#include <string>

#include "chunkvault/server/chunk_staging.hpp"
#include "chunkvault/server/object_store.hpp"
#include "chunkvault/server/upload_session.hpp"

namespace chunkvault::server
{

    struct FinalizeResult
    {
        std::string storage_key;
        std::uint64_t final_size{};
    };

    // Assembles a session's slots in ascending index order and commits them to the object store.
    class Finalizer
    {
    public:
        Finalizer(const ChunkStaging &staging, ObjectStore &objects);

        // The caller must have set `session.finalizing` under the session mutex and released
        // the mutex; this call clears it again. On success the session becomes Complete and its
        // slots are released. On failure the slots are kept so the commit can be retried, and
        // ProtocolError(StorageCommitFailed) is thrown.
        FinalizeResult finalize(UploadSession &session);

    private:
        const ChunkStaging &staging_;
        ObjectStore &objects_;
    };

} // namespace chunkvault::server
