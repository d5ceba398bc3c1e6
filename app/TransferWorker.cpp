// Sequential transfer queue over the core engine.
#include "TransferWorker.hpp"
#include "AppLogging.hpp"
#include "tscp/RuntimeLogging.hpp"
#include "tscp/TransferEngine.hpp"
#include <QMetaObject>

TransferWorker::TransferWorker(QObject* parent) : QObject(parent) {}

TransferWorker::~TransferWorker() {
    cancel_.store(true);
    if (worker_.joinable()) worker_.join();
}

quint64 TransferWorker::enqueue(TransferJob job) {
    quint64 id = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        id = job.id = nextId_++;
        queue_.push_back(std::move(job));
    }
    qCInfo(tscpTransfer) << "job queued" << "id=" << id;
    QMetaObject::invokeMethod(this, [this] { schedule(); }, Qt::QueuedConnection);
    return id;
}

int TransferWorker::pending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return (int)queue_.size();
}

void TransferWorker::cancelAll() {
    std::deque<TransferJob> dropped;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        dropped.swap(queue_);
    }
    cancel_.store(true);
    qCInfo(tscpTransfer) << "cancelAll requested" << "running=" << running_.load()
                         << "queued=" << (int)dropped.size();
    for (const auto& job : dropped) {
        tscp::TransferReport report;
        report.cancelled = true;
        emit finished(job.id, report);
    }
    if (!running_.load()) emit idle();
}

void TransferWorker::schedule() {
    if (running_.load()) return;
    if (worker_.joinable()) worker_.join();
    TransferJob job;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (queue_.empty()) {
            emit idle();
            return;
        }
        job = std::move(queue_.front());
        queue_.pop_front();
    }
    cancel_.store(false);
    running_.store(true);
    qCInfo(tscpTransfer) << "job started" << "id=" << job.id
                         << "src=" << QString::fromStdString(tscp::loggable(job.sourcePath))
                         << "dst=" << QString::fromStdString(tscp::loggable(job.destinationPath));
    worker_ = std::thread([this, job = std::move(job)]() mutable { runJob(std::move(job)); });
}

void TransferWorker::runJob(TransferJob job) {
    const quint64 id = job.id;
    tscp::TransferOptions opt = job.options;
    auto userCancel = job.options.should_cancel;
    opt.should_cancel = [this, userCancel] { return cancel_.load() || (userCancel && userCancel()); };
    auto userOutcome = job.options.on_outcome;
    opt.on_outcome = [this, id, userOutcome](const tscp::TransferOutcome& o) {
        if (userOutcome) userOutcome(o);
        QMetaObject::invokeMethod(this, [this, id, o] { emit outcome(id, o); }, Qt::QueuedConnection);
    };
    auto userProgress = job.options.progress_callback;
    opt.progress_callback = [this, id, userProgress](const tscp::TransferProgress& p) {
        if (userProgress) userProgress(p);
        QMetaObject::invokeMethod(this, [this, id, p] { emit progress(id, p); }, Qt::QueuedConnection);
    };

    tscp::TransferReport report =
        tscp::transfer(*job.source, job.sourcePath, *job.destination, job.destinationPath, opt);

    QMetaObject::invokeMethod(
        this,
        [this, id, report] {
            running_.store(false);
            if (report.ok()) {
                qCInfo(tscpTransfer) << "job finished" << "id=" << id
                                     << QString::fromStdString(report.summary());
            } else {
                qCWarning(tscpTransfer) << "job finished with failures" << "id=" << id
                                        << QString::fromStdString(report.summary());
            }
            emit finished(id, report);
            schedule();
        },
        Qt::QueuedConnection);
}
