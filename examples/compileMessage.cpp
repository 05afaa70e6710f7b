#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <string>

#include "MessageBuilder.hpp"
#include "solwire.hpp"

using json = nlohmann::json;

int main(int argc, char **argv) {
  // SPDLOG_LEVEL=debug to see the builder's log lines
  spdlog::cfg::load_env_levels();

  if (argc != 2) {
    spdlog::error("usage: {} <request.json>", argv[0]);
    return EXIT_FAILURE;
  }

  try {
    // 1. read the message request
    std::ifstream fileStream(argv[1]);
    if (!fileStream) {
      spdlog::error("could not open {}", argv[1]);
      return EXIT_FAILURE;
    }
    std::string fileContent(std::istreambuf_iterator<char>(fileStream), {});
    const auto builder =
        solwire::MessageBuilder::fromJson(json::parse(fileContent));

    // 2. compile & serialize
    const auto message = builder.compile();
    const auto bytes = message.serialize();
    spdlog::info("fee payer: {}", message.accountKeys.front().toBase58());
    spdlog::info("message: {}", json(message).dump(2));
    spdlog::info("{} bytes", bytes.size());

    // 3. wire bytes on stdout, ready to be signed
    std::cout << solwire::toHex(bytes) << std::endl;
  } catch (const solwire::MessageError &e) {
    spdlog::error("could not build message: {}", e.what());
    return EXIT_FAILURE;
  } catch (const std::exception &e) {
    spdlog::error("invalid request: {}", e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
