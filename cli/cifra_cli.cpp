#include "cifra/candidate_loader.h"
#include "cifra/escalation_json.h"
#include "cifra/exporter.h"
#include "cifra/lexicon.h"
#include "cifra/pipeline.h"
#include "cifra/settings.h"

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>

using namespace cifra;

namespace {

// Transport for a recorded answer: optionally stores the request, then
// returns the contents of the response file.
JsonBatchValidator::Transport file_transport(const std::string& request_path, const std::string& response_path) {
    return [request_path, response_path](const std::string& request, const EscalationContext&) {
        if (!request_path.empty()) {
            std::ofstream out(request_path);
            if (!out) {
                throw EscalationError("cannot write escalation request to " + request_path);
            }
            out << request << "\n";
        }
        std::ifstream in(response_path);
        if (!in) {
            throw EscalationError("cannot read escalation response " + response_path);
        }
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    };
}

} // namespace

int main(int argc, char** argv) {
    try {
        auto cli_settings = parse_arguments(argc, argv);
        ResolverSettings settings;

        if (!cli_settings.settings_file.empty()) {
            settings = load_settings(cli_settings);
        } else {
            settings = cli_settings;
        }

        if (settings.input_file.empty()) {
            std::cerr << "--input option is required" << std::endl;
            return 1;
        }

        std::shared_ptr<const Lexicon> lexicon;
        if (!settings.lexicon_file.empty()) {
            auto extended = std::make_shared<Lexicon>(Lexicon::spanish());
            if (!extended->load_external(settings.lexicon_file)) {
                std::cerr << "Failed to load lexicon file: " << settings.lexicon_file << std::endl;
                return 1;
            }
            lexicon = extended;
        }

        ResolutionPipeline pipeline(lexicon);
        pipeline.configure(settings);
        if (settings.verbose) {
            std::cerr << "[cifra] lexicon: " << (lexicon ? lexicon->info() : Lexicon::spanish().info()) << "\n";
        }

        std::vector<RawFieldCandidate> candidates;
        CandidateLoader loader;
        if (!loader.load(settings.input_file, candidates)) {
            std::cerr << "Failed to load input file: " << settings.input_file << std::endl;
            return 1;
        }

        std::unique_ptr<BatchValidator> validator;
        if (!settings.escalation_response_file.empty()) {
            validator = std::make_unique<JsonBatchValidator>(
                file_transport(settings.escalation_request_file, settings.escalation_response_file));
        }

        DocumentResolution resolution = pipeline.resolve_document(candidates, validator.get());

        const std::string format = settings.get("format", "toon");
        std::string rendered;
        if (format == "json") {
            rendered = results_to_json(resolution) + "\n";
        } else if (format == "report") {
            rendered = render_report(resolution.results);
        } else if (format == "toon") {
            rendered = render_toon(resolution.results);
        } else {
            std::cerr << "Unknown --format: " << format << " (toon, json, report)" << std::endl;
            return 1;
        }

        if (settings.outfile.empty()) {
            std::cout << rendered;
        } else {
            std::ofstream out(settings.outfile);
            if (!out) {
                std::cerr << "Cannot write output file: " << settings.outfile << std::endl;
                return 1;
            }
            out << rendered;
        }

        if (resolution.partial()) {
            std::cerr << "Warning: partial result (escalation " << to_string(resolution.escalation) << ")" << std::endl;
            if (settings.strict) {
                return 2;
            }
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
