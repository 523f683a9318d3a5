// Interactive video core simulator with SDL3 display and Lua scripting.
//
// This application runs the VideoCore model (all three clock domains),
// renders the display-enable pixel output to an SDL3 window, and executes
// host programming sequences from a Lua script (sol2). The script runs on
// its own thread and hands register and frame-memory writes to the
// simulation loop through a mutex-guarded queue; the simulation loop is the
// only thread that touches the model.
//
// Lua API (table `vid`):
//   vid.write_reg(addr, data)        -- register write, all byte lanes
//   vid.load_mode()                  -- write LOAD_MODE (commit shadow set)
//   vid.write_mem(addr, byte)        -- one frame-memory byte
//   vid.fill_mem(addr, size, byte)   -- frame-memory fill
//   vid.wait_vsync()                 -- block until the next vsync assertion
// Register offsets and packing helpers live in lua/vid_regs.lua.
//
// References:
//   video_core.hpp    -- model driven by the simulation loop
//   register_bank.hpp -- register map used by the scripts

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "video_core.hpp"
#include "video_error.hpp"

// SDL3 display
#include <SDL3/SDL.h>

// sol2 Lua binding
#include <sol/sol.hpp>

// ---------------------------------------------------------------------------
// Constants
// ---------------------------------------------------------------------------

/// Default display dimensions matching the power-on 640x480 mode.
static constexpr int DEFAULT_WIDTH  = 640;
static constexpr int DEFAULT_HEIGHT = 480;

/// SDL event poll interval (every N pixel clock ticks).
static constexpr int SDL_POLL_INTERVAL = 10000;

/// Gray levels for the two 1 bpp pixel values.
static constexpr uint8_t PIXEL_OFF = 0x10;
static constexpr uint8_t PIXEL_ON  = 0xE0;

// ---------------------------------------------------------------------------
// Command queue entry
// ---------------------------------------------------------------------------

/// One host operation requested by the Lua script.
struct SimCmd {
    enum class Kind : uint8_t {
        WRITE_REG, ///< Register write through the config domain
        WRITE_MEM, ///< Single frame-memory byte
        FILL_MEM,  ///< Frame-memory fill
    };

    Kind     kind = Kind::WRITE_REG;
    uint32_t addr = 0;    ///< Register offset or byte address
    uint32_t data = 0;    ///< Register value or fill/write byte
    uint32_t size = 0;    ///< FILL_MEM length in bytes
    uint8_t  strb = 0xF;  ///< WRITE_REG byte enables
};

// ---------------------------------------------------------------------------
// Shared state between Lua thread and simulation loop
// ---------------------------------------------------------------------------

/// Thread-safe command queue and synchronization primitives.
struct SharedState {
    std::mutex              mtx;
    std::condition_variable cmd_accepted_cv;  ///< Signaled when a command is consumed
    std::condition_variable vsync_cv;         ///< Signaled on vsync assertion

    std::queue<SimCmd>      cmd_queue;        ///< Pending commands from Lua
    bool                    wait_vsync = false;  ///< Lua is waiting for vsync
    bool                    vsync_occurred = false;  ///< Vsync event for Lua
    bool                    script_done = false;  ///< Lua script has finished
    bool                    quit = false;     ///< Request simulation exit
};

/// Queue one command and block until the simulation loop has taken it.
///
/// Throws once the simulation has stopped; sol2 turns that into a Lua
/// error, which unwinds scripts that loop forever.
static void submit(SharedState& shared, const SimCmd& cmd) {
    std::unique_lock<std::mutex> lock(shared.mtx);
    if (shared.quit) {
        throw std::runtime_error("simulation stopped");
    }
    shared.cmd_queue.push(cmd);
    shared.cmd_accepted_cv.wait(lock, [&shared] {
        return shared.cmd_queue.empty() || shared.quit;
    });
}

// ---------------------------------------------------------------------------
// Lua thread function
// ---------------------------------------------------------------------------

/// Run the Lua script in a separate thread.
///
/// The script calls vid.write_reg() and vid.wait_vsync() which block on
/// shared state condition variables until the main simulation loop processes
/// the requests.
static void lua_thread_func(const char* script_path, SharedState& shared) {
    sol::state lua;
    lua.open_libraries(sol::lib::base, sol::lib::math, sol::lib::string,
                       sol::lib::table, sol::lib::io, sol::lib::os,
                       sol::lib::package);

    // Set up Lua package path to find vid_regs.lua alongside the script
    // and in the sim/lua/ directory.
    {
        std::string path = lua["package"]["path"];
        std::string script_str(script_path);
        auto last_sep = script_str.find_last_of('/');
        if (last_sep != std::string::npos) {
            path += ";" + script_str.substr(0, last_sep + 1) + "?.lua";
        }
        path += ";fb_video/sim/lua/?.lua";
        path += ";sim/lua/?.lua";
        path += ";lua/?.lua";
        lua["package"]["path"] = path;
    }

    sol::table vid = lua.create_named_table("vid");

    vid["write_reg"] = [&shared](uint32_t addr, uint32_t data) {
        SimCmd cmd;
        cmd.kind = SimCmd::Kind::WRITE_REG;
        cmd.addr = addr;
        cmd.data = data;
        submit(shared, cmd);
    };

    vid["load_mode"] = [&shared]() {
        SimCmd cmd;
        cmd.kind = SimCmd::Kind::WRITE_REG;
        cmd.addr = REG_LOAD_MODE;
        cmd.data = 1;
        cmd.strb = 0x1;
        submit(shared, cmd);
    };

    vid["write_mem"] = [&shared](uint32_t addr, uint32_t byte) {
        SimCmd cmd;
        cmd.kind = SimCmd::Kind::WRITE_MEM;
        cmd.addr = addr;
        cmd.data = byte & 0xFF;
        submit(shared, cmd);
    };

    vid["fill_mem"] = [&shared](uint32_t addr, uint32_t size, uint32_t byte) {
        SimCmd cmd;
        cmd.kind = SimCmd::Kind::FILL_MEM;
        cmd.addr = addr;
        cmd.size = size;
        cmd.data = byte & 0xFF;
        submit(shared, cmd);
    };

    // vid.wait_vsync() -- block until the next vsync assertion.
    vid["wait_vsync"] = [&shared]() {
        std::unique_lock<std::mutex> lock(shared.mtx);
        if (shared.quit) {
            throw std::runtime_error("simulation stopped");
        }
        shared.vsync_occurred = false;
        shared.wait_vsync = true;
        shared.vsync_cv.wait(lock, [&shared] {
            return shared.vsync_occurred || shared.quit;
        });
        shared.wait_vsync = false;
    };

    // Load and execute the script
    try {
        auto result = lua.safe_script_file(script_path);
        if (!result.valid()) {
            sol::error err = result;
            fprintf(stderr, "Lua error: %s\n", err.what());
        }
    } catch (const sol::error& e) {
        fprintf(stderr, "Lua error: %s\n", e.what());
    } catch (const std::exception& e) {
        fprintf(stderr, "Exception in Lua script: %s\n", e.what());
    }

    // Signal that the script has finished
    {
        std::lock_guard<std::mutex> lock(shared.mtx);
        shared.script_done = true;
    }
    shared.vsync_cv.notify_all();
    shared.cmd_accepted_cv.notify_all();
}

/// Apply one script command to the model.
static void apply_command(VideoCore& core, const SimCmd& cmd) {
    switch (cmd.kind) {
        case SimCmd::Kind::WRITE_REG:
            core.write_reg(cmd.addr, cmd.data, cmd.strb);
            break;
        case SimCmd::Kind::WRITE_MEM:
            core.memory().write_byte(cmd.addr, static_cast<uint8_t>(cmd.data));
            break;
        case SimCmd::Kind::FILL_MEM:
            core.memory().fill(cmd.addr, cmd.size, static_cast<uint8_t>(cmd.data));
            break;
    }
}

// ---------------------------------------------------------------------------
// Usage
// ---------------------------------------------------------------------------

static void print_usage(const char* prog) {
    fprintf(stderr,
        "Usage: %s --script <path.lua> [--width N] [--height N]\n"
        "          [--pixel-mhz F] [--mem-mhz F]\n"
        "\n"
        "  --script <path>   Lua script to execute (required)\n"
        "  --width  <N>      Display width  (default: %d)\n"
        "  --height <N>      Display height (default: %d)\n"
        "  --pixel-mhz <F>   Pixel clock in MHz (default: %.3f)\n"
        "  --mem-mhz <F>     Memory clock in MHz (default: %.1f)\n",
        prog, DEFAULT_WIDTH, DEFAULT_HEIGHT,
        VideoCoreConfig{}.pixel_mhz, VideoCoreConfig{}.mem_mhz);
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main(int argc, char** argv) {
    // -------------------------------------------------------------------
    // 1. Parse command-line arguments
    // -------------------------------------------------------------------
    const char* script_path = nullptr;
    int disp_width  = DEFAULT_WIDTH;
    int disp_height = DEFAULT_HEIGHT;
    VideoCoreConfig config;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--script") == 0 && i + 1 < argc) {
            script_path = argv[++i];
        } else if (strcmp(argv[i], "--width") == 0 && i + 1 < argc) {
            disp_width = atoi(argv[++i]);
        } else if (strcmp(argv[i], "--height") == 0 && i + 1 < argc) {
            disp_height = atoi(argv[++i]);
        } else if (strcmp(argv[i], "--pixel-mhz") == 0 && i + 1 < argc) {
            config.pixel_mhz = atof(argv[++i]);
        } else if (strcmp(argv[i], "--mem-mhz") == 0 && i + 1 < argc) {
            config.mem_mhz = atof(argv[++i]);
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        }
    }

    if (script_path == nullptr || disp_width <= 0 || disp_height <= 0) {
        print_usage(argv[0]);
        return 1;
    }

    // -------------------------------------------------------------------
    // 2. Initialize the model
    // -------------------------------------------------------------------
    std::unique_ptr<VideoCore> core;
    try {
        core = std::make_unique<VideoCore>(config);
    } catch (const VideoError& e) {
        fprintf(stderr, "FATAL: %s\n", e.what());
        return 1;
    }

    // -------------------------------------------------------------------
    // 3. Initialize SDL3
    // -------------------------------------------------------------------
    if (!SDL_Init(SDL_INIT_VIDEO)) {
        fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_Window* window = SDL_CreateWindow(
        "fb_video sim",
        disp_width * 2, disp_height * 2,  // 2x scale for visibility
        SDL_WINDOW_RESIZABLE
    );
    if (!window) {
        fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, nullptr);
    if (!renderer) {
        fprintf(stderr, "SDL_CreateRenderer failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    SDL_Texture* texture = SDL_CreateTexture(
        renderer,
        SDL_PIXELFORMAT_RGBA32,
        SDL_TEXTUREACCESS_STREAMING,
        disp_width, disp_height
    );
    if (!texture) {
        fprintf(stderr, "SDL_CreateTexture failed: %s\n", SDL_GetError());
        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    // RGBA8888 pixel buffer for the current frame
    std::vector<uint8_t> pixel_buf(static_cast<size_t>(disp_width) * disp_height * 4, 0);

    // -------------------------------------------------------------------
    // 4. Pixel capture and vsync detection
    // -------------------------------------------------------------------
    SharedState shared;
    bool prev_vsync_active = false;
    uint64_t frames_presented = 0;

    core->set_pixel_callback([&](const VideoOutput& out) {
        if (out.display_enable && out.x >= 0 && out.y >= 0 &&
            out.x < disp_width && out.y < disp_height) {
            size_t idx = (static_cast<size_t>(out.y) * disp_width + out.x) * 4;
            uint8_t level = out.pixel ? PIXEL_ON : PIXEL_OFF;
            pixel_buf[idx + 0] = level;
            pixel_buf[idx + 1] = level;
            pixel_buf[idx + 2] = level;
            pixel_buf[idx + 3] = 0xFF;  // Alpha = opaque
        }

        // The pin level is polarity-adjusted; undo that to find assertion.
        uint8_t vpol = (core->timing().active().polarity >> 1) & 1;
        bool vsync_active = ((out.vsync ^ vpol) & 1) == 0;
        if (vsync_active && !prev_vsync_active) {
            SDL_UpdateTexture(texture, nullptr, pixel_buf.data(), disp_width * 4);
            SDL_RenderClear(renderer);
            SDL_RenderTexture(renderer, texture, nullptr, nullptr);
            SDL_RenderPresent(renderer);
            frames_presented++;

            std::lock_guard<std::mutex> lock(shared.mtx);
            if (shared.wait_vsync) {
                shared.vsync_occurred = true;
                shared.vsync_cv.notify_all();
            }
        }
        prev_vsync_active = vsync_active;
    });

    // -------------------------------------------------------------------
    // 5. Start script thread
    // -------------------------------------------------------------------
    std::thread lua_thread(lua_thread_func, script_path, std::ref(shared));

    // -------------------------------------------------------------------
    // 6. Main simulation loop
    // -------------------------------------------------------------------
    bool running = true;
    int exit_code = 0;
    uint64_t tick_count = 0;

    printf("Simulation running. Close the window or let the script finish to exit.\n");

    while (running) {
        // -- Command injection --
        // One script command per pixel tick; register writes are further
        // queued inside the core and applied one per config clock.
        {
            std::lock_guard<std::mutex> lock(shared.mtx);
            if (!shared.cmd_queue.empty()) {
                apply_command(*core, shared.cmd_queue.front());
                shared.cmd_queue.pop();
                shared.cmd_accepted_cv.notify_all();
            }
        }

        // -- Clock --
        try {
            core->run_pixel_ticks(1);
        } catch (const VideoError& e) {
            fprintf(stderr, "FATAL: %s\n", e.what());
            exit_code = 1;
            running = false;
        }
        tick_count++;

        // -- SDL event pump --
        if (tick_count % SDL_POLL_INTERVAL == 0) {
            SDL_Event event;
            while (SDL_PollEvent(&event)) {
                if (event.type == SDL_EVENT_QUIT) {
                    running = false;
                }
            }
        }

        // Once the script finishes, keep running so the user can inspect
        // the display output. The user closes the SDL window to exit.
    }

    // -------------------------------------------------------------------
    // 7. Teardown
    // -------------------------------------------------------------------
    {
        std::lock_guard<std::mutex> lock(shared.mtx);
        shared.quit = true;
        shared.cmd_accepted_cv.notify_all();
        shared.vsync_cv.notify_all();
    }

    if (lua_thread.joinable()) {
        lua_thread.join();
    }

    SDL_DestroyTexture(texture);
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();

    VideoCoreStats stats = core->stats();
    printf("DIAG: frames=%llu presented=%llu bursts=%llu splits=%llu underflows=%llu\n",
           static_cast<unsigned long long>(stats.frames),
           static_cast<unsigned long long>(frames_presented),
           static_cast<unsigned long long>(stats.bursts),
           static_cast<unsigned long long>(stats.splits),
           static_cast<unsigned long long>(stats.underflows));
    printf("Simulation complete. Total pixel cycles: %llu\n",
           static_cast<unsigned long long>(core->clock(Domain::PIXEL).ticks));

    return exit_code;
}
