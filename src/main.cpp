#include "client.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "response_json.hpp"
#include "util.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

static std::atomic<bool> g_interrupted{false};

static void signal_handler(int /*sig*/) {
    g_interrupted.store(true);
}

static void print_usage() {
    std::cout << "Usage: genai [options] PROMPT...\n"
              << "\n"
              << "Options:\n"
              << "  -s, --stream         Print the response as it is generated\n"
              << "  -m, --model NAME     Use specific model\n"
              << "  --count-tokens       Count the prompt's tokens instead of generating\n"
              << "  --json               Print raw responses as JSON\n"
              << "  --system TEXT        System instruction\n"
              << "  --temperature T      Sampling temperature\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "A PROMPT of \"-\" is read from stdin.\n"
              << "\n"
              << "Environment variables:\n"
              << "  GEMINI_API_KEY       API key (GOOGLE_API_KEY is also accepted)\n"
              << "  GENAI_MODEL          Default model\n"
              << "  GENAI_API_VERSION    API version (default: v1beta)\n"
              << "  GENAI_BASE_URL       API base URL\n";
}

static void print_response(const genai::GenerateContentResponse& response, bool as_json) {
    if (as_json) {
        std::cout << genai::encode_response(response).dump() << "\n";
    } else if (auto text = response.text()) {
        std::cout << *text << std::flush;
    }
}

static int run(const genai::ClientConfig& config, const genai::GenerateContentRequest& request,
               bool stream, bool count_tokens, bool as_json) {
    genai::PlatformHttpClient http_client;
    genai::GenerativeClient client(config, http_client);

    if (count_tokens) {
        genai::CountTokensRequest count{request.contents};
        auto result = client.count_tokens(count);
        if (as_json)
            std::cout << nlohmann::json{{"totalTokens", result.total_tokens}}.dump() << "\n";
        else
            std::cout << result.total_tokens << "\n";
        return 0;
    }

    if (!stream) {
        print_response(client.generate_content(request), as_json);
        if (!as_json) std::cout << "\n";
        return 0;
    }

    auto responses = client.generate_content_stream(request);
    while (auto response = responses->next()) {
        print_response(*response, as_json);
    }
    if (!as_json) std::cout << "\n";
    return 0;
}

int main(int argc, char* argv[]) try {
    bool stream = false;
    bool count_tokens = false;
    bool as_json = false;
    std::string model_name;
    std::string system_text;
    std::string temperature;
    std::string prompt;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "-s") == 0 || std::strcmp(argv[i], "--stream") == 0) {
            stream = true;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--model") == 0) && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--count-tokens") == 0) {
            count_tokens = true;
        } else if (std::strcmp(argv[i], "--json") == 0) {
            as_json = true;
        } else if (std::strcmp(argv[i], "--system") == 0 && i + 1 < argc) {
            system_text = argv[++i];
        } else if (std::strcmp(argv[i], "--temperature") == 0 && i + 1 < argc) {
            temperature = argv[++i];
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else {
            if (!prompt.empty()) prompt += " ";
            prompt += argv[i];
        }
    }

    if (prompt == "-") prompt = genai::read_all(std::cin);
    prompt = genai::trim(prompt);
    if (prompt.empty()) {
        print_usage();
        return 1;
    }

    auto config = genai::ClientConfig::load();
    if (!model_name.empty()) config.model = model_name;
    if (config.api_key.empty()) {
        std::cerr << "Error: no API key. Set GEMINI_API_KEY or api_key in ~/.genai/config.json\n";
        return 1;
    }

    genai::GenerateContentRequest request;
    request.contents.push_back(genai::text_content(prompt));
    if (!system_text.empty())
        request.system_instruction = genai::text_content(system_text, "system");
    if (!temperature.empty()) {
        genai::GenerationConfig generation;
        generation.temperature = std::stod(temperature);
        request.generation_config = generation;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    genai::http_init();
    genai::http_set_abort_flag(&g_interrupted);

    int rc = 1;
    try {
        rc = run(config, request, stream, count_tokens, as_json);
    } catch (const genai::PromptBlockedError& e) {
        std::cerr << "Error: " << e.what() << "\n";
    } catch (const genai::ResponseStoppedError& e) {
        // Terminate the partial line already printed
        if (!as_json) std::cout << "\n";
        std::cerr << "Error: " << e.what() << "\n";
    } catch (const genai::ServerError& e) {
        std::cerr << "Error: HTTP " << e.status_code() << ": " << e.message() << "\n";
    } catch (const genai::GenAIError& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }

    // An aborted transfer surfaces as whatever error the cut-off produced
    if (g_interrupted.load()) {
        std::cerr << "[genai] Interrupted.\n";
        rc = 130;
    }

    genai::http_set_abort_flag(nullptr);
    genai::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
