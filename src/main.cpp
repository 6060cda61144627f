/**
 * @file main.cpp
 * @brief Main entry point for the dlnacast control point
 */

#include "CastService.h"
#include "Logging.h"
#include "registry/DeviceRegistryAdapter.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

// Version information
#define DLNACAST_VERSION "1.0.0"
#define DLNACAST_BUILD_DATE __DATE__
#define DLNACAST_BUILD_TIME __TIME__

// Set by the signal handler, polled by the main loop
static volatile std::sig_atomic_t g_interrupted = 0;

// Signal handler for clean shutdown
void signalHandler(int signal) {
    (void)signal;
    g_interrupted = 1;
}

struct Options {
    CastService::Config service;
    int waitSeconds;

    DeviceFilter filter;
    std::string brand;
    std::string deviceId;

    bool list;
    bool watch;
    std::string castUrl;
    std::string title;
    std::string controlAction;

    Options()
        : waitSeconds(5)
        , list(false)
        , watch(false)
    {}
};

static void printUsage(const char* argv0) {
    std::cout << "DLNA Cast - UPnP AV control point\n\n"
              << "Usage: " << argv0 << " [options]\n\n"
              << "Options:\n"
              << "  --name, -n <name>       Control point name (default: DLNA Cast)\n"
              << "  --interface <name>      Network interface to bind (e.g., eth0)\n"
              << "  --port, -p <port>       UPnP port (default: auto)\n"
              << "  --wait, -w <secs>       Discovery time before acting (default: 5)\n"
              << "  --verbose, -v           Enable verbose debug output\n"
              << "  --version, -V           Show version information\n"
              << "  --help, -h              Show this help\n"
              << "\n"
              << "Renderer selection:\n"
              << "  --list, -l              List media renderers and exit\n"
              << "  --manufacturer <text>   Keep renderers whose manufacturer contains text\n"
              << "  --filter-name <text>    Keep renderers whose name contains text\n"
              << "  --brand <text>          Pick the first renderer matching a brand (e.g., Samsung)\n"
              << "  --device, -d <udn>      Pick a renderer by UDN\n"
              << "\n"
              << "Commands:\n"
              << "  --cast, -c <url>        Cast an http:// or https:// URL\n"
              << "  --title <title>         Item title (default: Video)\n"
              << "  --control <action>      Send play, pause or stop\n"
              << "  --watch                 Keep running and print renderer events\n"
              << "\n"
              << "Cast tuning:\n"
              << "  --timeout <ms>          Per-attempt deadline (default: 30000)\n"
              << "  --retries <n>           Maximum attempts, 1-16 (default: 3)\n"
              << "  --retry-delay <ms>      First retry delay, doubled each time (default: 1000)\n"
              << "  --settle <ms>           Pause between SetAVTransportURI and Play (default: 0)\n"
              << "\n"
              << "Examples:\n"
              << "  " << argv0 << " --list --manufacturer samsung\n"
              << "  " << argv0 << " --brand Samsung --cast http://192.168.1.10:8000/movie.mp4\n"
              << "  " << argv0 << " --device uuid:... --control pause\n"
              << std::endl;
}

// Parse command line arguments
static Options parseArguments(int argc, char* argv[]) {
    Options options;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if ((arg == "--name" || arg == "-n") && i + 1 < argc) {
            options.service.name = argv[++i];
        }
        else if (arg == "--interface" && i + 1 < argc) {
            options.service.networkInterface = argv[++i];
            std::cout << "✓ Will bind to interface: " << options.service.networkInterface << std::endl;
        }
        else if ((arg == "--port" || arg == "-p") && i + 1 < argc) {
            options.service.port = std::atoi(argv[++i]);
        }
        else if ((arg == "--wait" || arg == "-w") && i + 1 < argc) {
            options.waitSeconds = std::atoi(argv[++i]);
            if (options.waitSeconds < 0) {
                options.waitSeconds = 0;
            }
        }
        else if (arg == "--timeout" && i + 1 < argc) {
            options.service.cast.attemptTimeout = std::chrono::milliseconds(std::atol(argv[++i]));
            if (options.service.cast.attemptTimeout.count() < 1000) {
                std::cerr << "⚠️  Warning: timeout < 1000 ms leaves renderers little time to answer" << std::endl;
            }
        }
        else if (arg == "--retries" && i + 1 < argc) {
            options.service.cast.maxAttempts = std::atoi(argv[++i]);
            if (options.service.cast.maxAttempts < 1 ||
                options.service.cast.maxAttempts > CastOrchestrator::MAX_ATTEMPTS) {
                std::cerr << "❌ Invalid retry count. Must be between 1 and "
                          << CastOrchestrator::MAX_ATTEMPTS << std::endl;
                exit(1);
            }
        }
        else if (arg == "--retry-delay" && i + 1 < argc) {
            options.service.cast.initialRetryDelay = std::chrono::milliseconds(std::atol(argv[++i]));
        }
        else if (arg == "--settle" && i + 1 < argc) {
            options.service.cast.sourceSettleDelay = std::chrono::milliseconds(std::atol(argv[++i]));
        }
        else if (arg == "--manufacturer" && i + 1 < argc) {
            options.filter.manufacturer = argv[++i];
        }
        else if (arg == "--filter-name" && i + 1 < argc) {
            options.filter.name = argv[++i];
        }
        else if (arg == "--brand" && i + 1 < argc) {
            options.brand = argv[++i];
        }
        else if ((arg == "--device" || arg == "-d") && i + 1 < argc) {
            options.deviceId = argv[++i];
        }
        else if (arg == "--list" || arg == "-l") {
            options.list = true;
        }
        else if ((arg == "--cast" || arg == "-c") && i + 1 < argc) {
            options.castUrl = argv[++i];
        }
        else if (arg == "--title" && i + 1 < argc) {
            options.title = argv[++i];
        }
        else if (arg == "--control" && i + 1 < argc) {
            options.controlAction = argv[++i];
        }
        else if (arg == "--watch") {
            options.watch = true;
        }
        else if (arg == "--version" || arg == "-V") {
            std::cout << "═══════════════════════════════════════════════════════" << std::endl;
            std::cout << "  DLNA Cast - Version " << DLNACAST_VERSION << std::endl;
            std::cout << "═══════════════════════════════════════════════════════" << std::endl;
            std::cout << "Build: " << DLNACAST_BUILD_DATE << " " << DLNACAST_BUILD_TIME << std::endl;
            std::cout << "MIT License" << std::endl;
            exit(0);
        }
        else if (arg == "--verbose" || arg == "-v") {
            g_verbose = true;
            std::cout << "✓ Verbose mode enabled" << std::endl;
        }
        else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            exit(0);
        }
        else {
            std::cerr << "Unknown option: " << arg << std::endl;
            std::cerr << "Use --help for usage information" << std::endl;
            exit(1);
        }
    }

    if (!options.castUrl.empty() && !options.controlAction.empty()) {
        std::cerr << "❌ --cast and --control cannot be combined" << std::endl;
        exit(1);
    }

    return options;
}

static void printRenderer(size_t index, const RendererDevice& device) {
    std::cout << "  [" << index << "] " << device.name << std::endl;
    std::cout << "      Manufacturer: " << device.manufacturer << std::endl;
    std::cout << "      Model:        " << device.modelName << std::endl;
    std::cout << "      UDN:          " << device.id << std::endl;
}

// Sleep in small steps so Ctrl+C stays responsive
static void waitInterruptible(int seconds) {
    auto until = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (!g_interrupted && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

static bool selectRenderer(const Options& options,
                           const std::vector<RendererDevice>& renderers,
                           RendererDevice& device)
{
    if (!options.deviceId.empty()) {
        for (const auto& renderer : renderers) {
            if (renderer.id == options.deviceId) {
                device = renderer;
                return true;
            }
        }
        // Not (yet) listed: let the orchestrator resolve it
        device = RendererDevice();
        device.id = options.deviceId;
        device.name = options.deviceId;
        return true;
    }

    if (!options.brand.empty()) {
        if (DeviceRegistryAdapter::findRendererByBrand(renderers, options.brand, device)) {
            return true;
        }
        std::cerr << "❌ No renderer matches brand '" << options.brand << "'" << std::endl;
        return false;
    }

    if (renderers.empty()) {
        std::cerr << "❌ No media renderer found. Check that the TV is on and on the same network." << std::endl;
        return false;
    }

    device = renderers.front();
    return true;
}

static int reportResult(const char* what, const CastResult& result) {
    if (result.success) {
        std::cout << "✓ " << what << " succeeded";
        if (result.attempts > 1) {
            std::cout << " (" << result.attempts << " attempts)";
        }
        std::cout << std::endl;
        return 0;
    }

    std::cerr << "❌ " << what << " failed [" << castErrorKindName(result.kind) << "]: "
              << result.message << std::endl;
    return 1;
}

int main(int argc, char* argv[]) {
    // Setup signal handlers
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    std::cout << "═══════════════════════════════════════════════════════\n"
              << "  📺 DLNA Cast v" << DLNACAST_VERSION << "\n"
              << "═══════════════════════════════════════════════════════\n"
              << std::endl;

    // Parse arguments
    Options options = parseArguments(argc, argv);

    // Display configuration
    std::cout << "Configuration:" << std::endl;
    std::cout << "  Name:        " << options.service.name << std::endl;
    std::cout << "  Port:        " << (options.service.port == 0 ? "auto" : std::to_string(options.service.port)) << std::endl;
    if (!options.service.networkInterface.empty()) {
        std::cout << "  Network:     " << options.service.networkInterface << " (specific interface)" << std::endl;
    } else {
        std::cout << "  Network:     auto-detect (first available)" << std::endl;
    }
    std::cout << "  Attempts:    " << options.service.cast.maxAttempts
              << " x " << options.service.cast.attemptTimeout.count() << " ms" << std::endl;
    std::cout << std::endl;

    int exitCode = 0;

    try {
        auto service = std::make_unique<CastService>(options.service);

        EventSurface::Callbacks callbacks;
        callbacks.onDeviceFound = [](const RendererDevice& device) {
            std::cout << "📡 Found: " << device.name << " (" << device.manufacturer << ")" << std::endl;
        };
        callbacks.onDeviceLost = [](const std::string& deviceId) {
            std::cout << "📴 Lost: " << deviceId << std::endl;
        };
        callbacks.onCastProgress = [](const CastProgress& progress) {
            std::cout << "⏳ [" << castStageName(progress.stage) << "] " << progress.message
                      << " (" << progress.deviceName << ")" << std::endl;
        };
        service->setEventCallbacks(callbacks);

        std::cout << "🚀 Starting control point..." << std::endl;
        if (!service->startService()) {
            std::cerr << "❌ Failed to start control point" << std::endl;
            return 1;
        }

        std::cout << "🔍 Discovering renderers for " << options.waitSeconds << "s..." << std::endl;
        waitInterruptible(options.waitSeconds);

        std::vector<RendererDevice> renderers;
        CastResult listed = service->listRenderers(renderers);
        if (!listed.success) {
            service->stopService();
            return reportResult("Listing", listed);
        }
        renderers = DeviceRegistryAdapter::filterRenderers(renderers, options.filter);

        if (options.list || (options.castUrl.empty() && options.controlAction.empty() && !options.watch)) {
            std::cout << "\n" << renderers.size() << " media renderer(s):" << std::endl;
            for (size_t i = 0; i < renderers.size(); ++i) {
                printRenderer(i + 1, renderers[i]);
            }
            std::cout << std::endl;
        }

        if (!options.castUrl.empty() || !options.controlAction.empty()) {
            RendererDevice device;
            if (!selectRenderer(options, renderers, device)) {
                exitCode = 1;
            } else if (!options.castUrl.empty()) {
                std::cout << "📺 Casting to " << device.name << "..." << std::endl;
                exitCode = reportResult("Cast", service->cast(device.id, options.castUrl, options.title).get());
            } else {
                std::cout << "🎛  " << options.controlAction << " -> " << device.name << std::endl;
                exitCode = reportResult("Control", service->control(device.id, options.controlAction).get());
            }
        }

        if (options.watch) {
            std::cout << "👀 Watching for renderers (Press Ctrl+C to stop)" << std::endl;
            while (!g_interrupted && service->isRunning()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        }

        if (g_interrupted) {
            std::cout << "\n⚠️  Signal received, shutting down..." << std::endl;
        }

        service->stopService();

    } catch (const std::exception& e) {
        std::cerr << "❌ Exception: " << e.what() << std::endl;
        return 1;
    }

    return exitCode;
}
