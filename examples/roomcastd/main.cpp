/* Copyright 2026, Roomcast contributors. All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */


#include <roomcast/Engine.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <pthread.h>
#include <string>

namespace
{

void printHelp()
{
  std::cout << std::endl << " < R O O M C A S T D >" << std::endl << std::endl;
  std::cout << "usage: roomcastd [options]" << std::endl;
  std::cout << "  --port <port>         HTTP port, default 3400" << std::endl;
  std::cout << "  --bind <address>      address to listen on, default 0.0.0.0" << std::endl;
  std::cout << "  --address <address>   address speakers reach this host at" << std::endl;
  std::cout << "  --log-level <level>   debug, info, warning or error" << std::endl;
  std::cout << "  --secret <secret>     ingest token secret, default "
               "$ROOMCAST_INGEST_SECRET"
            << std::endl;
  std::cout << "  --help" << std::endl << std::endl;
}

bool parseArguments(const int argc, char** argv, roomcast::Engine::Settings& settings)
{
  for (int i = 1; i < argc; ++i)
  {
    const std::string option = argv[i];
    if (option == "--help")
    {
      printHelp();
      std::exit(EXIT_SUCCESS);
    }
    if (i + 1 == argc)
    {
      std::cerr << "missing value for " << option << std::endl;
      return false;
    }
    const std::string value = argv[++i];
    if (option == "--port")
    {
      char* pEnd = nullptr;
      const auto port = std::strtol(value.c_str(), &pEnd, 10);
      if (*pEnd != '\0' || port <= 0 || port > 65535)
      {
        std::cerr << "invalid port " << value << std::endl;
        return false;
      }
      settings.port = static_cast<std::uint16_t>(port);
    }
    else if (option == "--bind")
    {
      settings.bindAddress = value;
    }
    else if (option == "--address")
    {
      settings.advertisedAddress = value;
    }
    else if (option == "--log-level")
    {
      settings.logLevel = roomcast::util::parseLogLevel(value, settings.logLevel);
    }
    else if (option == "--secret")
    {
      settings.relay.ingestSecret = value;
    }
    else
    {
      std::cerr << "unknown option " << option << std::endl;
      return false;
    }
  }
  return true;
}

} // namespace

int main(int argc, char** argv)
{
  roomcast::Engine::Settings settings;
  if (const auto pSecret = std::getenv("ROOMCAST_INGEST_SECRET"))
  {
    settings.relay.ingestSecret = pSecret;
  }
  if (!parseArguments(argc, argv, settings))
  {
    printHelp();
    return EXIT_FAILURE;
  }

  // Blocked before any thread exists so that only sigwait sees them
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  try
  {
    roomcast::Engine engine{settings};
    engine.setEventHandler(
      [](const std::string& deviceIp, const roomcast::events::Event& event)
      { std::cout << deviceIp << ": " << event << std::endl; });

    engine.start();
    std::cout << "roomcastd serving on " << engine.baseUrl() << std::endl;
    std::cout << "  health:  " << engine.baseUrl() << "/health" << std::endl;
    std::cout << "  streams: " << engine.streamUrl("<id>") << std::endl;

    int received = 0;
    sigwait(&signals, &received);
    std::cout << std::endl << "stopping" << std::endl;
    engine.stop();
  }
  catch (const std::exception& e)
  {
    std::cerr << "roomcastd: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
