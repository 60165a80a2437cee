// Forwards core progress reports as a Qt signal so any number of
// subscribers can listen without the core knowing about Qt.
#pragma once
#include <QObject>
#include <QString>
#include "pibridge/ProgressSink.hpp"

class QtProgressSink : public QObject, public pibridge::ProgressSink {
    Q_OBJECT
public:
    explicit QtProgressSink(QObject* parent = nullptr) : QObject(parent) {}

    void report(pibridge::ProgressTopic topic, std::uint64_t value) override;

signals:
    // topic: "total-size", "download-progress", "upload-progress", "zip-progress"
    void progress(const QString& topic, quint64 value);
};
