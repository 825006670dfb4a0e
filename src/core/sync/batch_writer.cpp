#include "core/sync/batch_writer.h"
#include "core/shared/logging.h"
#include "core/vector/vector_table.h"

#include <algorithm>

namespace nv {

bool BatchWriteReport::allSucceeded() const
{
    return failedChunks() == 0;
}

int BatchWriteReport::failedChunks() const
{
    return static_cast<int>(std::count_if(chunks.begin(), chunks.end(),
                                          [](const ChunkOutcome& chunk) { return !chunk.ok; }));
}

BatchWriter::BatchWriter(VectorTable& table)
    : m_table(table)
{
}

int BatchWriter::chunkCount(int recordCount)
{
    if (recordCount <= 0) {
        return 0;
    }
    return (recordCount + kChunkSize - 1) / kChunkSize;
}

BatchWriteReport BatchWriter::write(const std::vector<NoteRecord>& records,
                                    const ProgressCallback& onProgress) const
{
    BatchWriteReport report;
    report.recordsAttempted = static_cast<int>(records.size());
    report.totalChunks = chunkCount(report.recordsAttempted);
    report.chunks.reserve(static_cast<size_t>(report.totalChunks));

    LOG_DEBUG(nvSync, "Writing %d record(s) in %d chunk(s) to %s",
              report.recordsAttempted, report.totalChunks, qUtf8Printable(m_table.name()));

    for (int chunkIndex = 0; chunkIndex < report.totalChunks; ++chunkIndex) {
        const size_t begin = static_cast<size_t>(chunkIndex) * kChunkSize;
        const size_t end = std::min(records.size(), begin + kChunkSize);
        const std::vector<NoteRecord> chunk(records.begin() + static_cast<std::ptrdiff_t>(begin),
                                            records.begin() + static_cast<std::ptrdiff_t>(end));

        ChunkOutcome outcome;
        outcome.index = chunkIndex;
        outcome.recordCount = static_cast<int>(chunk.size());
        outcome.ok = m_table.add(chunk, &outcome.error);
        if (outcome.ok) {
            report.recordsWritten += outcome.recordCount;
        } else {
            LOG_ERROR(nvSync, "Chunk %d/%d (%d records) failed: %s",
                      chunkIndex + 1, report.totalChunks, outcome.recordCount,
                      qUtf8Printable(outcome.error));
        }
        report.chunks.push_back(std::move(outcome));

        if (onProgress) {
            onProgress(static_cast<double>(chunkIndex + 1) / static_cast<double>(report.totalChunks));
        }
    }

    return report;
}

} // namespace nv
