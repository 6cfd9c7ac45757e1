// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_BATCH_HH
#define TEXTFLOW_TEXTFLOW_BATCH_HH

#include <defs.hh>

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <textflow/pipeline.hh>

#include <filesystem>
namespace fs = std::filesystem;

namespace textflow {

//
// The outcome of one document of a batch: an extraction, or the reason
// there is none:
//
struct batch_item_t {
    std::string name;
    std::optional< extraction_t > extraction;
    std::string failure;
};

using batch_t = std::vector< batch_item_t >;

//
// Number of workers for a requested number of jobs; zero asks for one per
// hardware thread:
//
size_t worker_count (size_t jobs, size_t ndocs);

//
// Processes documents on a pool of worker threads. Every document is loaded
// and processed by one worker, start to finish. Results come back in input
// order; a document that fails does not affect the others:
//
batch_t process_batch (
    const std::vector< fs::path >&, const params_t&, const collaborators_t&,
    size_t jobs = 0, const std::atomic< bool >* cancel = nullptr);

batch_t process_batch (
    const std::vector< document_t >&, const params_t&, const collaborators_t&,
    size_t jobs = 0, const std::atomic< bool >* cancel = nullptr);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_BATCH_HH
