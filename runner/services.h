#pragma once

#include "execq/admission.h"
#include "execq/backend.h"
#include "execq/config.h"
#include "execq/event_log.h"
#include "execq/executor.h"
#include "execq/poller.h"
#include "execq/proc.h"
#include "execq/reconciler.h"
#include "execq/run_processor.h"
#include "execq/run_store.h"

#include <filesystem>
#include <memory>
#include <string>

namespace execq {

// Everything a command needs, wired from one ExecConfig. Members are declared
// in dependency order so the backend (and its workers) is torn down before
// the processor, store and executor it references.
struct Services {
    ExecConfig cfg;
    std::unique_ptr<ILauncher> launcher;
    std::unique_ptr<Executor> executor;
    std::unique_ptr<IRunStore> store;
    std::unique_ptr<RunEventLog> events;
    std::unique_ptr<RunProcessor> processor;
    std::unique_ptr<Reconciler> reconciler;
    std::unique_ptr<IJobBackend> backend;
    std::unique_ptr<AdmissionController> admission;
    std::unique_ptr<RunPoller> poller;

    ~Services();
};

std::filesystem::path store_dir(const ExecConfig& cfg);
std::filesystem::path spool_dir(const ExecConfig& cfg);
std::filesystem::path events_path(const ExecConfig& cfg);

ExecutorConfig executor_config(const ExecConfig& cfg);

// Builds the object graph. Workers are not started. Returns empty string on success.
std::string build_services(const ExecConfig& cfg, Services* out);

} // namespace execq
