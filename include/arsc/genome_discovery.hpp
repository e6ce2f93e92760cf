#pragma once

#include "arsc/genome_scheduler.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace arsc {

// Accepted protein file suffixes, longest first
extern const char* const kProteinSuffixes[3];

// Length of the protein suffix `filename` ends with, or 0 if none matches.
size_t protein_suffix_length(const std::string& filename);

/**
 * Resolve an input argument to the protein files to analyse.
 *
 * A regular file must carry a protein suffix. A directory contributes its
 * direct entries with a protein suffix, sorted by name.
 * Throws std::invalid_argument for a missing path, a file with another
 * suffix, or a directory without matching files.
 */
std::vector<std::filesystem::path> collect_protein_files(const std::string& input);

// File name without directory and protein suffix: "dir/Ecoli.faa.gz" -> "Ecoli"
std::string genome_id_from_path(const std::filesystem::path& path);

// One FASTA-backed GenomeInput per file, opened lazily by the worker
std::vector<GenomeInput> make_genome_inputs(const std::vector<std::filesystem::path>& files,
                                            size_t decoder_threads = 1);

}  // namespace arsc
