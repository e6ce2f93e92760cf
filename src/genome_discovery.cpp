#include "arsc/genome_discovery.hpp"
#include "arsc/fasta_reader.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace arsc {

const char* const kProteinSuffixes[3] = {".faa.zst", ".faa.gz", ".faa"};

size_t protein_suffix_length(const std::string& filename) {
    for (const char* suffix : kProteinSuffixes) {
        const std::string s(suffix);
        if (filename.size() > s.size() &&
            filename.compare(filename.size() - s.size(), s.size(), s) == 0) {
            return s.size();
        }
    }
    return 0;
}

std::vector<fs::path> collect_protein_files(const std::string& input) {
    std::error_code ec;
    const fs::path root(input);

    if (fs::is_regular_file(root, ec)) {
        if (protein_suffix_length(root.filename().string()) == 0) {
            throw std::invalid_argument("Not a .faa, .faa.gz or .faa.zst file: " + input);
        }
        return {root};
    }

    if (!fs::is_directory(root, ec)) {
        throw std::invalid_argument("Input path does not exist: " + input);
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(root, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        if (protein_suffix_length(entry.path().filename().string()) > 0) {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        throw std::invalid_argument("Cannot read directory " + input + ": " + ec.message());
    }
    if (files.empty()) {
        throw std::invalid_argument("No .faa, .faa.gz or .faa.zst files found in " + input);
    }

    std::sort(files.begin(), files.end(),
              [](const fs::path& a, const fs::path& b) {
                  return a.filename().string() < b.filename().string();
              });
    return files;
}

std::string genome_id_from_path(const fs::path& path) {
    std::string name = path.filename().string();
    name.resize(name.size() - protein_suffix_length(name));
    return name;
}

std::vector<GenomeInput> make_genome_inputs(const std::vector<fs::path>& files,
                                            size_t decoder_threads) {
    std::vector<GenomeInput> inputs;
    inputs.reserve(files.size());
    for (const auto& file : files) {
        const std::string path = file.string();
        inputs.push_back({genome_id_from_path(file),
                          [path, decoder_threads]() -> std::unique_ptr<SequenceSource> {
                              return std::make_unique<FastaSequenceSource>(path, decoder_threads);
                          }});
    }
    return inputs;
}

}  // namespace arsc
