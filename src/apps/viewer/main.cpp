// Collapsing toolbar viewer: ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include <toolbar_canvas/canvas.hpp>
#include <toolbar_layout/log.hpp>
#include <toolbar_loaders/json_loader.hpp>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

int main(int argc, char* argv[])
{
    bool auto_collapse_test = false;
    std::string toolbar_path;
    std::string log_level;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--auto-collapse-test") {
            auto_collapse_test = true;
        } else if (arg == "--toolbar" && i + 1 < argc) {
            toolbar_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else {
            (void)fprintf(stderr, "usage: %s [--toolbar <file.json>] [--log-level <level>] [--auto-collapse-test]\n", argv[0]);
            return 1;
        }
    }

    spdlog::cfg::load_env_levels();
    const spdlog::level::level_enum level = log_level.empty()
        ? spdlog::level::info : spdlog::level::from_str(log_level);
    toolbar_layout::init_file_logging(toolbar_layout::find_project_root() / "logs" / "toolbar_viewer_latest.log", level);

    SDL_SetMainReady();
    // SDL3: SDL_Init returns true on success, false on failure
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        (void)fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    const int window_width = 560;
    const int window_height = 480;
    const SDL_WindowFlags window_flags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
        | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    SDL_Window* window = SDL_CreateWindow("Collapsing toolbar", window_width, window_height, window_flags);
    if (!window) {
        (void)fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        (void)fprintf(stderr, "SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    ImGui::StyleColorsDark();

    ImGui_ImplSDL3_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 130");

    std::optional<toolbar_model::ToolbarDescription> description;
    std::vector<std::string> paths;
    if (!toolbar_path.empty()) paths.push_back(toolbar_path);
    paths.push_back("data/example_toolbar.json");
    paths.push_back("example_toolbar.json");
    for (const auto& path : paths) {
        auto loaded = toolbar_loaders::load_toolbar_from_json_file(path);
        if (loaded) {
            description = std::move(*loaded);
            break;
        }
    }
    if (!description) {
        toolbar_layout::layout_logger()->info("No toolbar description found; using the demo toolbar");
        description = toolbar_loaders::generate_demo_toolbar();
    }

    toolbar_canvas::ToolbarCanvas toolbar_canvas;
    toolbar_canvas.set_description(std::move(*description));

    bool running = true;
    int frame = 0;
    // Frames spent sweeping from expanded to collapsed.
    const int sweep_frames = 60;
    const int warmup_frames = 3;
    const int max_test_frames = 600;
    int test_exit_code = 0;
    std::vector<float> sweep_progress;
    int sweep_from = 0;
    int sweep_to = 0;

    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL3_ProcessEvent(&event);
            if (event.type == SDL_EVENT_QUIT)
                running = false;
            if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED &&
                event.window.windowID == SDL_GetWindowID(window))
                running = false;
        }

        if (auto_collapse_test && frame >= warmup_frames) {
            const auto& state = toolbar_canvas.state();
            if (frame == warmup_frames) {
                sweep_from = state.max_height;
                sweep_to = state.min_height;
            }
            const int step = frame - warmup_frames;
            if (step <= sweep_frames) {
                const int h = sweep_from + (sweep_to - sweep_from) * step / sweep_frames;
                toolbar_canvas.set_target_height(h);
            }
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        ImGui::SetNextWindowPos(ImVec2(0, 0));
        ImGui::SetNextWindowSize(io.DisplaySize);
        ImGui::Begin("Toolbar", nullptr,
            ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove
            | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);
        ImVec2 canvas_size = ImGui::GetContentRegionAvail();
        if (canvas_size.x > 0 && canvas_size.y > 0) {
            ImGui::BeginChild("canvas", canvas_size, false, ImGuiWindowFlags_NoScrollbar);
            toolbar_canvas.update_and_draw(canvas_size.x, canvas_size.y);
            ImGui::EndChild();
        }
        ImGui::End();

        if (auto_collapse_test && frame >= warmup_frames) {
            const int step = frame - warmup_frames;
            if (step <= sweep_frames)
                sweep_progress.push_back(toolbar_canvas.progress());

            if (step == sweep_frames || frame >= max_test_frames) {
                const bool monotonic = std::is_sorted(sweep_progress.rbegin(), sweep_progress.rend());
                const bool ends_ok = !sweep_progress.empty()
                    && sweep_progress.front() == 1.0f && sweep_progress.back() == 0.0f;
                (void)fprintf(stderr,
                    "[auto-collapse-test] finished frame=%d range=[%d, %d] monotonic=%d ends=%d\n",
                    frame, sweep_to, sweep_from, monotonic ? 1 : 0, ends_ok ? 1 : 0);
                test_exit_code = monotonic && ends_ok ? 0 : 2;
                running = false;
            }
        }

        ImGui::Render();
        SDL_GL_MakeCurrent(window, gl_context);
        const int fb_w = (int)(io.DisplaySize.x * io.DisplayFramebufferScale.x);
        const int fb_h = (int)(io.DisplaySize.y * io.DisplayFramebufferScale.y);
        glViewport(0, 0, fb_w, fb_h);
        glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
        ++frame;
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DestroyContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    if (auto_collapse_test) {
        return test_exit_code;
    }
    return 0;
}
