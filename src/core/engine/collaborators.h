#pragma once

#include "core/shared/passage.h"

#include <QString>
#include <QStringList>

#include <optional>
#include <vector>

namespace vq {

// Acquires a video's audio, transcribes and chunks it, and pushes the
// passages into the dense index. Returns the indexed passages, or nullopt
// when any stage fails.
class TranscriptIndexer {
public:
    virtual ~TranscriptIndexer() = default;
    virtual std::optional<std::vector<Passage>> indexVideo(const QString& videoId) = 0;
};

// Language-model step. Both calls return nullopt on failure. `answer` may be
// called with an empty context; returning nullopt there declines to answer.
class AnswerGenerator {
public:
    virtual ~AnswerGenerator() = default;
    virtual std::optional<QString> answer(const QString& videoId,
                                          const QString& query,
                                          const QStringList& context) = 0;
    virtual std::optional<QString> summarize(const QString& videoId,
                                             const QString& content,
                                             const QString& length) = 0;
};

} // namespace vq
