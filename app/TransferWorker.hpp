// Transfer queue: jobs run one at a time on a background thread; progress,
// outcomes and reports come back to the owning thread as queued signals.
#pragma once
#include "tscp/HostBridge.hpp"
#include "tscp/TransferTypes.hpp"
#include <QObject>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

struct TransferJob {
    quint64 id = 0;  // assigned by enqueue()
    std::shared_ptr<tscp::HostBridge> source;
    std::string sourcePath;
    std::shared_ptr<tscp::HostBridge> destination;
    std::string destinationPath;
    tscp::TransferOptions options;
};

class TransferWorker : public QObject {
    Q_OBJECT
public:
    explicit TransferWorker(QObject* parent = nullptr);
    ~TransferWorker();

    // Returns the job id.
    quint64 enqueue(TransferJob job);
    // Cancels the running job cooperatively and drops the queued ones (each
    // still gets a finished() with a cancelled, empty report).
    void cancelAll();

    bool busy() const { return running_.load(); }
    int pending() const;

signals:
    void progress(quint64 id, const tscp::TransferProgress& p);
    void outcome(quint64 id, const tscp::TransferOutcome& o);
    void finished(quint64 id, const tscp::TransferReport& report);
    // Queue drained and nothing running.
    void idle();

private:
    std::deque<TransferJob> queue_;
    mutable std::mutex mtx_;  // protects queue_
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<bool> cancel_{false};
    quint64 nextId_ = 1;

    // Starts the next job when nothing is running (owning thread only).
    void schedule();
    void runJob(TransferJob job);
};
