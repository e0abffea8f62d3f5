// main_vis.cpp
// Interactive monitor for one emergence run.
// - Engine is stepped on the UI thread, a fixed number of steps per frame
// - Plots read the engine's own telemetry-equivalent metrics via observe()
// - X-Z phase-space scatter of the five particles plus the four attractor centers
// - Crystallized configuration is shown as a table once the latch fires

#include <vector>
#include <string>
#include <cmath>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstdint>

#include "EmergenceEngine.h"

#include "imgui.h"
// ---- Docking compatibility shim: only the docking branch of ImGui defines IMGUI_HAS_DOCK
#ifndef IMGUI_HAS_DOCK
#define CEE_NO_IMGUI_DOCKING 1
#endif
#include "implot.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#endif

#include <GLFW/glfw3.h>

#ifdef __APPLE__
#  include <OpenGL/gl.h>
#else
#  include <GL/gl.h>
#endif

static void glfw_error_callback(int error, const char* description) {
    std::fprintf(stderr, "GLFW Error %d: %s\n", error, description ? description : "(null)");
}

static int fail(const char* msg) {
    std::fprintf(stderr, "FATAL: %s\n", msg ? msg : "(null)");
    std::fprintf(stderr, "\n");
    return EXIT_FAILURE;
}

struct VisualUIState {
    bool show_controls = true;
    bool show_plots = true;
    bool show_phase = true;
    bool show_result = true;
};

struct History {
    std::vector<double> t, order, entropy, chaos, dwell;

    void clear() {
        t.clear(); order.clear(); entropy.clear(); chaos.clear(); dwell.clear();
    }

    void push(const cee::EngineSnapshot& s) {
        t.push_back(s.t);
        order.push_back(s.metrics.order_parameter);
        entropy.push_back(s.metrics.entropy);
        chaos.push_back(s.metrics.chaos_estimate);
        dwell.push_back(s.transition.dwell_time);
    }
};

static void plot_line_with_xlimits(const char* title,
                                   const char* label,
                                   const double* xs,
                                   const double* ys,
                                   int count,
                                   double t0,
                                   double t1,
                                   double ref_y = std::nan(""))
{
    if (count <= 1)
        return;

    if (ImPlot::BeginPlot(title)) {
        ImPlot::SetupAxisLimits(ImAxis_X1, t0, t1, ImGuiCond_Always);

        ImPlot::PlotLine(label, xs, ys, count);
        if (std::isfinite(ref_y)) {
            const double rx[2] = {t0, t1};
            const double ry[2] = {ref_y, ref_y};
            ImPlot::PlotLine("threshold", rx, ry, 2);
        }

        ImPlot::EndPlot();
    }
}

static void entity_table(const char* id, const std::vector<cee::EmergentEntity>& entities, bool hun) {
    if (ImGui::BeginTable(id, 5, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg)) {
        ImGui::TableSetupColumn("Name");
        ImGui::TableSetupColumn("Strength");
        ImGui::TableSetupColumn(hun ? "Purity" : "Viscosity");
        ImGui::TableSetupColumn("Connection");
        ImGui::TableSetupColumn("Function");
        ImGui::TableHeadersRow();
        for (const auto& e : entities) {
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0); ImGui::TextUnformatted(e.name.c_str());
            ImGui::TableSetColumnIndex(1); ImGui::Text("%.3f", e.strength);
            ImGui::TableSetColumnIndex(2); ImGui::Text("%.3f", hun ? e.purity : e.viscosity);
            ImGui::TableSetColumnIndex(3); ImGui::Text("%.3f", e.connection);
            ImGui::TableSetColumnIndex(4); ImGui::TextUnformatted(e.function_description.c_str());
        }
        ImGui::EndTable();
    }
}

int main(int argc, char** argv) {
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) return fail("glfwInit failed");

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

    GLFWwindow* window = glfwCreateWindow(1280, 720, "Emergence Monitor", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return fail("glfwCreateWindow failed");
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // vsync

    const GLubyte* gl_version = glGetString(GL_VERSION);
    if (!gl_version) {
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("OpenGL context validation failed (glGetString(GL_VERSION) returned null)");
    }
    std::fprintf(stderr, "OpenGL Version:  %s\n", gl_version);

    bool imgui_ctx = false;
    bool implot_ctx = false;
    bool imgui_glfw = false;
    bool imgui_gl3 = false;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    imgui_ctx = true;

    ImGuiIO& io = ImGui::GetIO();
#ifndef CEE_NO_IMGUI_DOCKING
    io.ConfigFlags |= ImGuiConfigFlags_DockingEnable;
#endif
    (void)io;

    ImPlot::CreateContext();
    implot_ctx = true;

    ImGui::StyleColorsDark();

    if (!ImGui_ImplGlfw_InitForOpenGL(window, true)) {
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplGlfw_InitForOpenGL failed");
    }
    imgui_glfw = true;

    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplOpenGL3_Init failed");
    }
    imgui_gl3 = true;

    // --- CLI flags ---
    int seed_ui = 1337;
    for (int i = 1; i + 1 < argc; ++i) {
        if (argv[i] && std::string(argv[i]) == "--seed") {
            seed_ui = std::atoi(argv[i + 1]);
        }
    }

    VisualUIState ui;

    cee::EmergenceEngine engine;
    std::string status_line;

    float conc_ui[cee::kParticleTypeCount] = {0.7f, 0.8f, 0.6f, 0.5f, 0.4f};
    int steps_per_frame = 5;
    bool self_coupling = false;
    bool running = false;

    bool have_result = false;
    cee::EmergentConfiguration result{};

    History hist;
    hist.t.reserve(20000);

    auto reset_run = [&]() {
        cee::InitialConcentrations conc;
        for (int i = 0; i < cee::kParticleTypeCount; ++i) {
            conc[static_cast<cee::ParticleType>(i)] = static_cast<double>(conc_ui[i]);
        }
        cee::EngineConfigV1 cfg;
        cfg.include_self_coupling_u32 = self_coupling ? 1u : 0u;
        running = false;
        have_result = false;
        hist.clear();
        if (!engine.setConfig(cfg) || !engine.reset(conc, static_cast<std::uint32_t>(seed_ui))) {
            status_line = engine.lastError();
            return;
        }
        status_line = "ready";
        hist.push(engine.observe());
    };

    auto capture_result = [&]() {
        if (!have_result && engine.hasCrystallized()) {
            result = engine.crystallize();
            have_result = true;
            running = false;
            status_line = result.forced ? "forced crystallization" : "crystallized";
        }
    };

    reset_run();

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        if (running && engine.isReady() && !engine.hasCrystallized()) {
            for (int s = 0; s < steps_per_frame && !engine.hasCrystallized(); ++s) {
                if (engine.stepCount() >= engine.activeConfig().max_iterations) {
                    engine.forceCrystallization();
                    break;
                }
                engine.step();
                hist.push(engine.observe());
            }
        }
        capture_result();

        const cee::EngineSnapshot snap = engine.observe();

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

#ifndef CEE_NO_IMGUI_DOCKING
        ImGui::DockSpaceOverViewport(ImGui::GetMainViewport());
#endif

        if (ui.show_controls) {
            ImGui::Begin(">> CONTROL CONSOLE", &ui.show_controls);

            const ImVec4 cmd_header = ImVec4(0.0f, 1.0f, 0.0f, 1.0f);

            ImGui::TextColored(cmd_header, "[INIT] Concentrations");
            ImGui::Separator();
            for (int i = 0; i < cee::kParticleTypeCount; ++i) {
                ImGui::SliderFloat(cee::particleTypeName(static_cast<cee::ParticleType>(i)),
                                   &conc_ui[i], 0.0f, 1.0f, "%.3f");
            }
            ImGui::InputInt("Seed", &seed_ui);
            ImGui::Checkbox("Self coupling", &self_coupling);
            ImGui::Spacing();

            ImGui::TextColored(cmd_header, "[EXEC] Transport Controls");
            ImGui::Separator();
            if (ImGui::Button(running ? "  PAUSE  " : "   RUN   ", ImVec2(100, 0))) running = !running;
            ImGui::SameLine();
            if (ImGui::Button("  STEP  ", ImVec2(100, 0))) {
                engine.step();
                hist.push(engine.observe());
            }
            ImGui::SameLine();
            if (ImGui::Button(" RESET ", ImVec2(100, 0))) reset_run();
            if (ImGui::Button("[ CRYSTALLIZE NOW ]", ImVec2(-1, 25))) {
                engine.forceCrystallization();
            }
            ImGui::SliderInt("Steps/frame", &steps_per_frame, 1, 200);
            ImGui::Spacing();

            ImGui::TextColored(cmd_header, "[STATUS] Current State");
            ImGui::Separator();
            ImGui::Text("Status:      %s", status_line.c_str());
            ImGui::Text("Time:        %.2f", snap.t);
            ImGui::Text("Steps:       %llu", static_cast<unsigned long long>(snap.step));
            ImGui::Text("Order:       %.4f", snap.metrics.order_parameter);
            ImGui::Text("Entropy:     %.4f", snap.metrics.entropy);
            ImGui::Text("Chaos:       %.4f", snap.metrics.chaos_estimate);
            ImGui::Text("Dwell:       %.2f / %.2f", snap.transition.dwell_time, engine.activeConfig().min_dwell_time);
            ImGui::End();
        }

        if (ui.show_plots) {
            ImGui::Begin(">> METRICS", &ui.show_plots);
            const int count = static_cast<int>(hist.t.size());
            if (count > 1) {
                const double t0 = hist.t.front();
                const double t1 = std::max(hist.t.back(), t0 + engine.activeConfig().dt);
                ImGui::Text("Samples: %d  [%.2f, %.2f]", count, t0, t1);
                plot_line_with_xlimits("Order parameter", "order", hist.t.data(), hist.order.data(), count,
                                       t0, t1, engine.activeConfig().critical_threshold);
                plot_line_with_xlimits("Entropy", "entropy", hist.t.data(), hist.entropy.data(), count, t0, t1);
                plot_line_with_xlimits("Chaos estimate", "chaos", hist.t.data(), hist.chaos.data(), count, t0, t1);
                plot_line_with_xlimits("Dwell time", "dwell", hist.t.data(), hist.dwell.data(), count, t0, t1,
                                       engine.activeConfig().min_dwell_time);
            }
            ImGui::End();
        }

        if (ui.show_phase) {
            ImGui::Begin(">> PHASE SPACE (X-Z)", &ui.show_phase);
            if (ImPlot::BeginPlot("##phase", ImVec2(-1, -1), ImPlotFlags_Equal)) {
                for (int i = 0; i < cee::ParticleField::size(); ++i) {
                    const cee::ParticleState& p = engine.field().at(i);
                    const double x = p.position.x;
                    const double z = p.position.z;
                    ImPlot::PlotScatter(cee::particleTypeName(static_cast<cee::ParticleType>(i)), &x, &z, 1);
                }
                double ax[cee::kAttractorKindCount];
                double az[cee::kAttractorKindCount];
                for (int k = 0; k < cee::kAttractorKindCount; ++k) {
                    const cee::AttractorGeometry g = cee::attractorGeometry(static_cast<cee::AttractorKind>(k), snap.t);
                    ax[k] = g.center.x;
                    az[k] = g.center.z;
                }
                ImPlot::PlotScatter("attractors", ax, az, cee::kAttractorKindCount);
                ImPlot::EndPlot();
            }
            ImGui::End();
        }

        if (ui.show_result && have_result) {
            ImGui::Begin(">> CONFIGURATION", &ui.show_result);
            ImGui::Text("Signature: %s%s", result.signature.c_str(), result.forced ? "  (forced)" : "");
            ImGui::Text("Birth attractor: %s  yang=%.3f yin=%.3f",
                        cee::attractorKindName(result.birth_attractor.kind),
                        result.birth_attractor.yang_intensity,
                        result.birth_attractor.yin_intensity);
            ImGui::Text("Crystallized at t=%.2f (%llu steps)", result.crystallized_at_t,
                        static_cast<unsigned long long>(result.steps));
            ImGui::Separator();
            ImGui::Text("Hun (%zu)", result.hun.size());
            entity_table("##hun", result.hun, true);
            ImGui::Text("Po (%zu)", result.po.size());
            entity_table("##po", result.po, false);
            ImGui::End();
        }

        ImGui::Render();

        int fb_w = 0, fb_h = 0;
        glfwGetFramebufferSize(window, &fb_w, &fb_h);

        if (fb_w > 0 && fb_h > 0) {
            glViewport(0, 0, fb_w, fb_h);
            glClearColor(0.06f, 0.06f, 0.07f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        }

        glfwSwapBuffers(window);
    }

    // Cleanup
    if (implot_ctx) ImPlot::DestroyContext();
    if (imgui_gl3) ImGui_ImplOpenGL3_Shutdown();
    if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
    if (imgui_ctx) ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
