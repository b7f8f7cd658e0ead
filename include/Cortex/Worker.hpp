// =================================================================
// include/Cortex/Worker.hpp
// =================================================================
// Interface of a single executable worker.

#pragma once

#include "Cortex/WorkerTypes.hpp"
#include <string>
#include <functional>
#include <utility>

namespace Cortex {

/**
 * @brief Raw result of one worker run
 *
 * Quality may be on the 0-1 or 0-100 scale; the executor normalizes it.
 * Left at AUTO, a score of 1 or below is read as 0-1, so a worker on the
 * 0-100 scale reporting 1% must set PERCENT to be read correctly.
 */
struct WorkerResult {
    std::string content;
    double quality = 0.0;
    QualityScale scale = QualityScale::AUTO;
};

/**
 * @brief Abstract worker
 *
 * run() may be called from an executor thread and may throw; a throwing
 * worker is skipped for that query.
 */
class Worker {
public:
    virtual ~Worker() = default;

    virtual WorkerId getId() const = 0;

    virtual WorkerResult run(const std::string& query) = 0;
};

/**
 * @brief Worker backed by a callable
 */
class FunctionWorker : public Worker {
public:
    using RunFunction = std::function<WorkerResult(const std::string&)>;

    FunctionWorker(WorkerId id, RunFunction fn) : m_id(std::move(id)), m_fn(std::move(fn)) {}

    WorkerId getId() const override { return m_id; }

    WorkerResult run(const std::string& query) override { return m_fn(query); }

private:
    WorkerId m_id;
    RunFunction m_fn;
};

} // namespace Cortex
