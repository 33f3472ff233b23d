#include "agentstream/error.hpp"
#include "agentstream/http_client.hpp"
#include "agentstream/logging.hpp"
#include "agentstream/session.hpp"
#include "agentstream/stream_reader.hpp"
#include "agentstream/utils/base64.hpp"
#include "agentstream/utils/files.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

std::atomic<agentstream::StreamSession*> g_active_session{nullptr};

void handle_interrupt(int) {
  if (auto* session = g_active_session.load()) {
    session->abort();
  }
}

struct Arguments {
  std::string source;
  std::optional<std::filesystem::path> image_dir;
  bool quiet = false;
};

void print_usage() {
  std::cerr << "usage: tool_trace [--quiet] [--save-images DIR] <file|-|http(s)://url>\n"
            << "Prints one JSON line per tool snapshot and per nested agent update. AGENTSTREAM_LOG controls diagnostics.\n";
}

std::optional<Arguments> parse_arguments(int argc, char** argv) {
  Arguments args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--quiet") {
      args.quiet = true;
    } else if (arg == "--save-images") {
      if (i + 1 >= argc) return std::nullopt;
      args.image_dir = std::filesystem::path(argv[++i]);
    } else if (arg == "-h" || arg == "--help") {
      return std::nullopt;
    } else if (args.source.empty()) {
      args.source = arg;
    } else {
      return std::nullopt;
    }
  }
  if (args.source.empty()) return std::nullopt;
  return args;
}

bool is_url(const std::string& source) {
  return source.rfind("http://", 0) == 0 || source.rfind("https://", 0) == 0;
}

void feed_from_stream(std::istream& input, agentstream::StreamSession& session) {
  std::vector<char> buffer(16 * 1024);
  while (input && !session.aborted()) {
    input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto got = input.gcount();
    if (got > 0) {
      session.feed(buffer.data(), static_cast<std::size_t>(got));
    }
  }
  session.finish();
}

std::size_t save_image_frames(const std::vector<agentstream::ToolState>& tools, const std::filesystem::path& dir) {
  std::filesystem::create_directories(dir);
  std::size_t written = 0;
  for (const auto& tool : tools) {
    if (tool.name != "image_generation" || !tool.output || !tool.output->is_array()) continue;
    for (const auto& frame : *tool.output) {
      const std::string src = frame.value("src", std::string{});
      auto decoded = agentstream::utils::decode_data_url(src);
      if (!decoded) continue;
      const auto index = frame.value("outputIndex", 0);
      std::filesystem::path path =
          dir / (agentstream::utils::safe_file_stem(tool.id) + "_" + std::to_string(index) + "." +
                 agentstream::utils::extension_for_mime(decoded->mime_type));
      std::ofstream out(path, std::ios::binary);
      out.write(reinterpret_cast<const char*>(decoded->bytes.data()), static_cast<std::streamsize>(decoded->bytes.size()));
      if (!out) {
        throw agentstream::AgentStreamError("Failed to write image frame to " + path.string());
      }
      ++written;
    }
  }
  return written;
}

}  // namespace

int main(int argc, char** argv) {
  auto args = parse_arguments(argc, argv);
  if (!args) {
    print_usage();
    return 2;
  }

  std::vector<agentstream::ToolState> latest;
  agentstream::CallbackObserver observer(
      [&](std::vector<agentstream::ToolState> states) {
        if (!args->quiet) {
          std::cout << nlohmann::json(states).dump() << "\n";
        }
        latest = std::move(states);
      },
      [](const agentstream::ProtocolEvent& event) {
        if (event.kind == agentstream::EventKind::Error && event.error) {
          std::cerr << "[stream error] " << event.error->message << "\n";
        }
      },
      [&](std::vector<agentstream::AgentToolStream> streams) {
        if (!args->quiet) {
          std::cout << nlohmann::json{{"agent_tool_streams", streams}}.dump() << "\n";
        }
      });

  try {
    agentstream::SessionOptions options;
    options.logger = [](agentstream::LogLevel level, const std::string& message, const nlohmann::json& details) {
      std::cerr << "[" << agentstream::log_level_name(level) << "] " << message << " " << details.dump() << "\n";
    };

    agentstream::StreamSession session(&observer, options);
    g_active_session.store(&session);
    std::signal(SIGINT, handle_interrupt);

    if (is_url(args->source)) {
      auto client = agentstream::make_curl_streaming_client();
      agentstream::StreamRequest request;
      request.url = args->source;
      agentstream::read_event_stream(*client, request, session);
    } else if (args->source == "-") {
      feed_from_stream(std::cin, session);
    } else {
      std::ifstream file(args->source, std::ios::binary);
      if (!file) {
        std::cerr << "Failed to open " << args->source << "\n";
        g_active_session.store(nullptr);
        return 1;
      }
      feed_from_stream(file, session);
    }
    g_active_session.store(nullptr);

    std::cerr << "frames: " << session.frame_count() << ", tools: " << latest.size()
              << ", errors: " << session.error_count() << "\n";

    if (args->image_dir) {
      const auto written = save_image_frames(latest, *args->image_dir);
      std::cerr << "image frames written: " << written << "\n";
    }
  } catch (const agentstream::StreamAbortedError& error) {
    g_active_session.store(nullptr);
    std::cerr << "Stream aborted: " << error.what() << "\n";
    return 130;
  } catch (const agentstream::HttpError& error) {
    g_active_session.store(nullptr);
    std::cerr << "HTTP error (" << error.status_code() << "): " << error.what() << "\n";
    if (!error.body().empty()) {
      std::cerr << error.body() << "\n";
    }
    return 1;
  } catch (const agentstream::AgentStreamError& error) {
    g_active_session.store(nullptr);
    std::cerr << "agentstream error: " << error.what() << "\n";
    return 1;
  } catch (const std::exception& error) {
    g_active_session.store(nullptr);
    std::cerr << "Unexpected error: " << error.what() << "\n";
    return 1;
  }

  return 0;
}
