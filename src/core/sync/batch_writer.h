#pragma once

#include "core/shared/note_record.h"

#include <QString>

#include <functional>
#include <vector>

namespace nv {

class VectorTable;

// Fraction of chunks attempted so far, in (0, 1].
using ProgressCallback = std::function<void(double)>;

struct ChunkOutcome {
    int index = 0;
    int recordCount = 0;
    bool ok = false;
    QString error;
};

struct BatchWriteReport {
    int totalChunks = 0;
    int recordsAttempted = 0;
    int recordsWritten = 0;
    std::vector<ChunkOutcome> chunks;

    bool allSucceeded() const;
    int failedChunks() const;
};

// BatchWriter -- commits records in contiguous chunks of kChunkSize, one
// atomic table add() per chunk, strictly in input order.
//
// A failed chunk is logged and recorded in the report; the remaining chunks
// are still attempted. Completion therefore means "every chunk attempted",
// not "every record persisted". Progress is reported once per chunk,
// success or failure; an empty input reports no progress.
class BatchWriter {
public:
    static constexpr int kChunkSize = 50;

    explicit BatchWriter(VectorTable& table);

    BatchWriteReport write(const std::vector<NoteRecord>& records,
                           const ProgressCallback& onProgress = {}) const;

    static int chunkCount(int recordCount);

private:
    VectorTable& m_table;
};

} // namespace nv
