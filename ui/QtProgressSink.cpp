#include "QtProgressSink.hpp"

void QtProgressSink::report(pibridge::ProgressTopic topic, std::uint64_t value) {
    emit progress(QString::fromLatin1(pibridge::topicName(topic)), static_cast<quint64>(value));
}
