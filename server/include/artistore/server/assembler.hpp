#pragma once

#include <string>

#include "artistore/result.hpp"
#include "artistore/server/chunk_staging.hpp"
#include "artistore/server/duplicate_index.hpp"
#include "artistore/server/session_store.hpp"
#include "artistore/server/storage_sink.hpp"

namespace artistore::server
{

    struct FinalizeOutcome
    {
        std::string artifact_id;
        FinalizedFile file;
        bool deduplicated{};
    };

    // Turns a fully received session into a finalized file exactly once.
    //
    // The session stays locked for the whole assembly. A failed whole-object
    // digest rolls the session back to ACTIVE with its chunks intact; a
    // repeated finalize on a COMPLETE session returns the recorded result.
    class Assembler
    {
    public:
        Assembler(SessionStore &store, ChunkStaging &staging, DuplicateIndex &index, StorageSink &sink);

        Result<FinalizeOutcome> finalize(const std::string &session_id, const std::string &asserted_digest);

    private:
        Result<FinalizeOutcome> assemble(SessionHandle &handle, const std::string &asserted_digest);

        SessionStore &store_;
        ChunkStaging &staging_;
        DuplicateIndex &index_;
        StorageSink &sink_;
    };

} // namespace artistore::server
