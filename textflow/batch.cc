// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <thread>

#include <textflow/batch.hh>
#include <textflow/document.hh>

namespace textflow {
namespace {

//
// Runs `fn (i)' for every index in [0, n) on `jobs' threads:
//
template< typename F >
void run_pool (size_t n, size_t jobs, F fn) {
    std::atomic< size_t > next{ 0 };

    auto worker = [&]() {
        for (size_t i; (i = next++) < n;) {
            fn (i);
        }
    };

    std::vector< std::thread > workers;

    for (size_t i = 1; i < jobs; ++i) {
        workers.emplace_back (worker);
    }

    worker ();

    for (auto& t : workers) {
        t.join ();
    }
}

template< typename Load >
batch_t process_all (
    size_t n, Load load, const params_t& params,
    const collaborators_t& collaborators, size_t jobs,
    const std::atomic< bool >* cancel) {
    batch_t batch (n);

    run_pool (n, worker_count (jobs, n), [&](size_t i) {
        auto& item = batch [i];

        try {
            const auto doc = load (i, item.name);

            if (cancel && cancel->load ()) {
                item.failure = "cancelled";
                return;
            }

            item.extraction = process_document (
                doc, params, collaborators, cancel);
        }
        catch (const malformed_input& e) {
            item.failure = e.what ();
            error (errSyntaxError, -1, "{0:s}", e.what ());
        }
        catch (const std::exception& e) {
            item.failure = e.what ();
            error (errIO, -1, "{0:s}: {1:s}", item.name, e.what ());
        }
    });

    return batch;
}

} // anonymous

size_t worker_count (size_t jobs, size_t ndocs) {
    if (0 == jobs) {
        jobs = std::thread::hardware_concurrency ();
    }

    if (0 == jobs) {
        jobs = 1;
    }

    return (std::max) (size_t (1), (std::min) (jobs, ndocs));
}

batch_t process_batch (
    const std::vector< fs::path >& paths, const params_t& params,
    const collaborators_t& collaborators, size_t jobs,
    const std::atomic< bool >* cancel) {
    return process_all (
        paths.size (), [&](size_t i, std::string& name) {
            name = paths [i].stem ().string ();
            return load_document (paths [i]);
        },
        params, collaborators, jobs, cancel);
}

batch_t process_batch (
    const std::vector< document_t >& docs, const params_t& params,
    const collaborators_t& collaborators, size_t jobs,
    const std::atomic< bool >* cancel) {
    return process_all (
        docs.size (), [&](size_t i, std::string& name) {
            name = docs [i].name;
            return docs [i];
        },
        params, collaborators, jobs, cancel);
}

} // namespace textflow
