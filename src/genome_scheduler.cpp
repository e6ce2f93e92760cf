#include "arsc/genome_scheduler.hpp"
#include "arsc/composition.hpp"

#include <algorithm>
#include <new>
#include <stdexcept>

namespace arsc {

namespace {

JobResult make_failure(const std::string& genome_id, ErrorKind kind, const std::string& message) {
    JobResult result;
    result.genome_id = genome_id;
    result.failure = GenomeFailure{genome_id, kind, message};
    return result;
}

}  // anonymous namespace

JobResult process_genome(const GenomeInput& input) {
    try {
        if (!input.open) {
            throw GenomeError(ErrorKind::IOError, "no sequence source");
        }
        std::unique_ptr<SequenceSource> source = input.open();
        if (!source) {
            throw GenomeError(ErrorKind::IOError, "no sequence source");
        }

        GenomeAccumulator acc;
        std::string sequence;
        while (source->next(sequence)) {
            fold(acc, count_composition(sequence));
        }

        JobResult result;
        result.genome_id = input.genome_id;
        result.metrics = finalize(acc, input.genome_id);
        return result;
    } catch (const GenomeError& e) {
        return make_failure(input.genome_id, e.kind(), e.what());
    } catch (const std::bad_alloc&) {
        return make_failure(input.genome_id, ErrorKind::IOError, "out of memory");
    } catch (const std::exception& e) {
        return make_failure(input.genome_id, ErrorKind::IOError, e.what());
    }
}

std::vector<JobResult> run_genomes(const std::vector<GenomeInput>& genomes,
                                   int worker_count,
                                   const ProgressCallback& progress) {
    if (worker_count < 1) {
        throw std::invalid_argument("worker_count must be >= 1, got " +
                                    std::to_string(worker_count));
    }

    const size_t total = genomes.size();
    std::vector<JobResult> results(total);
    if (total == 0) return results;

    // Each slot is written by exactly one worker; no further locking needed.
    const int workers = static_cast<int>(std::min<size_t>(static_cast<size_t>(worker_count), total));
    size_t done = 0;

    #pragma omp parallel for schedule(dynamic, 1) num_threads(workers)
    for (size_t i = 0; i < total; ++i) {
        results[i] = process_genome(genomes[i]);

        // Counted under the same lock so callbacks see done strictly increasing
        #pragma omp critical(arsc_progress)
        {
            const size_t finished = ++done;
            if (progress) progress(finished, total, results[i]);
        }
    }

    return results;
}

}  // namespace arsc
