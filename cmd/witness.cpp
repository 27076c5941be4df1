// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <CLI/CLI.hpp>
#include <magic_enum.hpp>
#include <nlohmann/json.hpp>

#include <witgen/infra/cli/common.hpp>
#include <witgen/infra/common/log.hpp>
#include <witgen/witness/aligner.hpp>
#include <witgen/witness/builder.hpp>
#include <witgen/witness/json.hpp>
#include <witgen/witness/verifier.hpp>

using namespace witgen;

// Checks that the two proofs of a key, once aligned, differ only along the key
static void verify_proof_pair(const witness::ProofPair& pair, ByteView key, std::string_view trie_name) {
    const auto path{witness::unwrap_or_throw(witness::align(pair.before, pair.after, key),
                                             std::string{trie_name} + " proofs cannot be aligned")};
    witness::success_or_throw(witness::verify_parallel_paths(path.chain(witness::Side::kBefore),
                                                             path.chain(witness::Side::kAfter), key),
                              std::string{trie_name} + " proofs diverge outside the key");
    log::Info("Proofs verified", {"trie", std::string{trie_name},
                                  "depth", std::to_string(path.steps().size()),
                                  "alignment", std::string{magic_enum::enum_name(path.state())}});
}

static nlohmann::json read_json(const std::filesystem::path& file) {
    std::ifstream in{file};
    if (!in) {
        throw std::runtime_error{"cannot open " + file.string()};
    }
    return nlohmann::json::parse(in);
}

int main(int argc, char* argv[]) {
    CLI::App app{"Generate the MPT witness of state modifications"};

    std::filesystem::path input_file;
    cmd::common::add_option_input_file(app, input_file);

    std::optional<std::filesystem::path> output_file;
    cmd::common::add_option_output_file(app, output_file);

    bool verify{false};
    app.add_flag("--verify", verify, "Also check that the input proofs differ only along the modified key")
        ->capture_default_str();

    log::Settings log_settings{};
    cmd::common::add_logging_options(app, log_settings);

    CLI11_PARSE(app, argc, argv)

    try {
        log::init(log_settings);

        const auto inputs{witness::inputs_from_json(read_json(input_file))};
        for (const auto& input : inputs) {
            log::Info("Generating witness", {"modification", input.modification.to_string()});
            if (verify) {
                verify_proof_pair(input.account_proof, input.modification.account_path(), "account");
                if (input.storage_proof && input.modification.is_storage_write()) {
                    verify_proof_pair(*input.storage_proof, input.modification.storage_path(), "storage");
                }
            }
        }

        const auto matrix{witness::unwrap_or_throw(witness::generate_witness(inputs))};
        const nlohmann::json output = matrix;
        if (output_file) {
            std::ofstream out{*output_file};
            if (!out) {
                throw std::runtime_error{"cannot write " + output_file->string()};
            }
            out << output.dump() << "\n";
        } else {
            std::cout << output.dump() << "\n";
        }

        log::Info("Witness written", {"rows", std::to_string(matrix.size()),
                                      "placeholders", std::to_string(matrix.count_flagged(witness::kFlagBeforePlaceholder) +
                                                                     matrix.count_flagged(witness::kFlagAfterPlaceholder))});
    } catch (const witness::WitnessException& ex) {
        log::Error() << ex.what();
        return -2;
    } catch (const std::exception& ex) {
        log::Error() << ex.what();
        return -1;
    }
    return 0;
}
