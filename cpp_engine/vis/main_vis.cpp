// main_vis.cpp
// - Drives KilnSimulator from a wall-time accumulator (sim seconds per wall second is a UI knob)
// - Every control edit is posted as a Command; the simulator applies them between ticks
// - Plots read KilnSimulator::history() (bounded ring, oldest first)
// - 3D: rotating kiln shell (world::KilnShell), colored by burning-zone temperature,
//   flame cone at the burner end scaled by control output

#include <vector>
#include <string>
#include <cmath>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstdint>

#include "KilnSimulator.h"
#include "KilnMetrics.h"
#include "EmissionsModel.h"
#include "PlantModel.h"

// Shell geometry and rotation kinematics (no UI dependencies)
#include "../world/kiln_shell.h"

#include "imgui.h"
// ---- Docking compatibility shim (older ImGui builds do not define docking flags/APIs)
#ifndef ImGuiConfigFlags_DockingEnable
#define KILNSIM_NO_IMGUI_DOCKING 1
#endif
#include "implot.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

// Platform GL headers: on Windows, <GL/gl.h> requires Windows types/macros (APIENTRY/WINGDIAPI).
// Include <windows.h> first to avoid syntax errors in the Windows SDK gl.h.
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

// ============================================================
// Minimal 3D kiln (fixed-pipeline, deterministic, no assets)
// ============================================================

struct Vec3f { float x, y, z; };

static Vec3f v3(float x, float y, float z) { return {x,y,z}; }

static Vec3f to_v3f(const kiln::world::Vec3d& v) {
    return v3((float)v.x, (float)v.y, (float)v.z);
}

static Vec3f add(Vec3f a, Vec3f b) { return {a.x+b.x, a.y+b.y, a.z+b.z}; }
static Vec3f sub(Vec3f a, Vec3f b) { return {a.x-b.x, a.y-b.y, a.z-b.z}; }
static Vec3f mul(Vec3f a, float s)  { return {a.x*s, a.y*s, a.z*s}; }

static float clampf(float x, float lo, float hi) {
    return (x < lo) ? lo : (x > hi) ? hi : x;
}

static float dot(Vec3f a, Vec3f b) { return a.x*b.x + a.y*b.y + a.z*b.z; }
static Vec3f cross(Vec3f a, Vec3f b) { return { a.y*b.z - a.z*b.y, a.z*b.x - a.x*b.z, a.x*b.y - a.y*b.x }; }
static float len(Vec3f a) { return std::sqrt(dot(a,a)); }
static Vec3f norm(Vec3f a) {
    float l = len(a);
    return (l > 1e-6f) ? mul(a, 1.0f/l) : v3(0,0,0);
}

static void set_perspective(float fovy_deg, float aspect, float znear, float zfar) {
    // OpenGL fixed pipeline expects column-major matrix.
    const float fovy_rad = fovy_deg * 3.1415926535f / 180.0f;
    const float f = 1.0f / std::tan(0.5f * fovy_rad);

    float m[16] = {};
    m[0]  = f / aspect;
    m[5]  = f;
    m[10] = (zfar + znear) / (znear - zfar);
    m[11] = -1.0f;
    m[14] = (2.0f * zfar * znear) / (znear - zfar);

    glMatrixMode(GL_PROJECTION);
    glLoadMatrixf(m);
}

static void look_at(Vec3f eye, Vec3f center, Vec3f up) {
    // Minimal lookAt for fixed pipeline.
    Vec3f fwd = sub(center, eye);
    float fl = len(fwd);
    if (fl > 1e-6f) fwd = mul(fwd, 1.0f / fl);

    float ul = len(up);
    if (ul > 1e-6f) up = mul(up, 1.0f / ul);

    Vec3f s = cross(fwd, up);
    float sl = len(s);
    if (sl > 1e-6f) s = mul(s, 1.0f / sl);

    Vec3f u = cross(s, fwd);

    float m[16] = {
        s.x,  u.x,  -fwd.x, 0.0f,
        s.y,  u.y,  -fwd.y, 0.0f,
        s.z,  u.z,  -fwd.z, 0.0f,
        0.0f, 0.0f, 0.0f,   1.0f
    };

    glMatrixMode(GL_MODELVIEW);
    glLoadMatrixf(m);
    glTranslatef(-eye.x, -eye.y, -eye.z);
}

static void draw_wire_box(Vec3f c, Vec3f half) {
    const float x0 = c.x - half.x, x1 = c.x + half.x;
    const float y0 = c.y - half.y, y1 = c.y + half.y;
    const float z0 = c.z - half.z, z1 = c.z + half.z;

    glBegin(GL_LINES);
    // bottom
    glVertex3f(x0,y0,z0); glVertex3f(x1,y0,z0);
    glVertex3f(x1,y0,z0); glVertex3f(x1,y0,z1);
    glVertex3f(x1,y0,z1); glVertex3f(x0,y0,z1);
    glVertex3f(x0,y0,z1); glVertex3f(x0,y0,z0);
    // top
    glVertex3f(x0,y1,z0); glVertex3f(x1,y1,z0);
    glVertex3f(x1,y1,z0); glVertex3f(x1,y1,z1);
    glVertex3f(x1,y1,z1); glVertex3f(x0,y1,z1);
    glVertex3f(x0,y1,z1); glVertex3f(x0,y1,z0);
    // verticals
    glVertex3f(x0,y0,z0); glVertex3f(x0,y1,z0);
    glVertex3f(x1,y0,z0); glVertex3f(x1,y1,z0);
    glVertex3f(x1,y0,z1); glVertex3f(x1,y1,z1);
    glVertex3f(x0,y0,z1); glVertex3f(x0,y1,z1);
    glEnd();
}

static void draw_solid_box(Vec3f c, Vec3f half) {
    const float x0 = c.x - half.x, x1 = c.x + half.x;
    const float y0 = c.y - half.y, y1 = c.y + half.y;
    const float z0 = c.z - half.z, z1 = c.z + half.z;

    glBegin(GL_QUADS);
    // +Z
    glVertex3f(x0,y0,z1); glVertex3f(x1,y0,z1); glVertex3f(x1,y1,z1); glVertex3f(x0,y1,z1);
    // -Z
    glVertex3f(x1,y0,z0); glVertex3f(x0,y0,z0); glVertex3f(x0,y1,z0); glVertex3f(x1,y1,z0);
    // +X
    glVertex3f(x1,y0,z1); glVertex3f(x1,y0,z0); glVertex3f(x1,y1,z0); glVertex3f(x1,y1,z1);
    // -X
    glVertex3f(x0,y0,z0); glVertex3f(x0,y0,z1); glVertex3f(x0,y1,z1); glVertex3f(x0,y1,z0);
    // +Y
    glVertex3f(x0,y1,z1); glVertex3f(x1,y1,z1); glVertex3f(x1,y1,z0); glVertex3f(x0,y1,z0);
    // -Y
    glVertex3f(x0,y0,z0); glVertex3f(x1,y0,z0); glVertex3f(x1,y0,z1); glVertex3f(x0,y0,z1);
    glEnd();
}

static void draw_line(Vec3f a, Vec3f b) {
    glBegin(GL_LINES);
    glVertex3f(a.x,a.y,a.z);
    glVertex3f(b.x,b.y,b.z);
    glEnd();
}

static void temp_to_color(float tempC, float& r, float& g, float& b) {
    // Ambient gray -> dull red -> orange -> yellow-white at the clinkering zone.
    float t = clampf((tempC - 20.0f) / (1500.0f - 20.0f), 0.0f, 1.0f);
    r = 0.30f + 0.70f * t;
    g = 0.30f * (1.0f - t) + 0.85f * t * t;
    b = 0.32f * (1.0f - t) + 0.35f * t * t * t;
}

static ImVec4 clinker_color(kiln::ClinkerQuality q) {
    switch (q) {
        case kiln::ClinkerQuality::Good:    return ImVec4(0.0f, 1.0f, 0.0f, 1.0f);
        case kiln::ClinkerQuality::Partial: return ImVec4(1.0f, 1.0f, 0.0f, 1.0f);
        case kiln::ClinkerQuality::Poor:    return ImVec4(1.0f, 0.2f, 0.2f, 1.0f);
    }
    return ImVec4(0.7f, 0.7f, 0.7f, 1.0f);
}

// Draw a simple cone aligned to dir_unit in world space (apex at the burner pipe).
static void draw_cone_world(Vec3f apex, Vec3f dir_unit, float length_m, float radius_m, int slices = 16) {
    Vec3f d = norm(dir_unit);
    if (len(d) < 1e-6f || length_m <= 1e-4f || radius_m <= 1e-4f) return;

    // Orthonormal basis with z = d
    Vec3f up = (std::abs(d.y) < 0.9f) ? v3(0,1,0) : v3(1,0,0);
    Vec3f x = norm(cross(up, d));
    Vec3f y = cross(d, x);

    Vec3f base_center = add(apex, mul(d, length_m));

    glBegin(GL_TRIANGLES);
    for (int i = 0; i < slices; ++i) {
        const float a0 = (2.0f * 3.1415926535f * (float)i) / (float)slices;
        const float a1 = (2.0f * 3.1415926535f * (float)(i+1)) / (float)slices;

        Vec3f p0 = add(base_center, add(mul(x, radius_m * std::cos(a0)), mul(y, radius_m * std::sin(a0))));
        Vec3f p1 = add(base_center, add(mul(x, radius_m * std::cos(a1)), mul(y, radius_m * std::sin(a1))));

        glVertex3f(apex.x, apex.y, apex.z);
        glVertex3f(p0.x,   p0.y,   p0.z);
        glVertex3f(p1.x,   p1.y,   p1.z);
    }
    glEnd();
}

// Shell surface as quads between neighbouring rings, then ring and seam lines on top.
static void draw_kiln_shell(const kiln::world::KilnShellGeometry& g, float tempC, bool wire_only) {
    if (g.ring_count < 2 || g.ring_segments < 3) return;

    float r, gr, b;
    temp_to_color(tempC, r, gr, b);

    if (!wire_only) {
        glColor3f(r, gr, b);
        glBegin(GL_QUADS);
        for (int k = 0; k + 1 < g.ring_count; ++k) {
            for (int j = 0; j < g.ring_segments; ++j) {
                const int jn = (j + 1) % g.ring_segments;
                const Vec3f p00 = to_v3f(g.ringVertex(k, j));
                const Vec3f p01 = to_v3f(g.ringVertex(k, jn));
                const Vec3f p11 = to_v3f(g.ringVertex(k + 1, jn));
                const Vec3f p10 = to_v3f(g.ringVertex(k + 1, j));
                glVertex3f(p00.x, p00.y, p00.z);
                glVertex3f(p10.x, p10.y, p10.z);
                glVertex3f(p11.x, p11.y, p11.z);
                glVertex3f(p01.x, p01.y, p01.z);
            }
        }
        glEnd();
    }

    // Rings
    glColor3f(0.08f, 0.08f, 0.09f);
    for (int k = 0; k < g.ring_count; ++k) {
        glBegin(GL_LINE_LOOP);
        for (int j = 0; j < g.ring_segments; ++j) {
            const Vec3f p = to_v3f(g.ringVertex(k, j));
            glVertex3f(p.x, p.y, p.z);
        }
        glEnd();
    }

    // Longitudinal seams (every other segment so the rotation reads clearly)
    for (int j = 0; j < g.ring_segments; j += 2) {
        draw_line(to_v3f(g.ringVertex(0, j)), to_v3f(g.ringVertex(g.ring_count - 1, j)));
    }
}

struct VisualUIState {
    bool show_hud = true;
    bool show_controls = true;

    bool draw_ground = true;
    bool draw_supports = true;
    bool draw_shell = true;
    bool shell_wire_only = false;
    bool draw_seam_marker = true;
    bool draw_flame = true;
};

static void plot_line_with_xlimits(const char* title,
                                  const char* label,
                                  const double* xs,
                                  const double* ys,
                                  int count,
                                  double t0,
                                  double t1)
{
    if (count <= 1)
        return;

    if (ImPlot::BeginPlot(title)) {

        // --- X-axis handling (robust across ImPlot versions) ---
#if defined(ImAxis_X1)
        // ImPlot >= 0.16
        ImPlot::SetupAxisLimits(ImAxis_X1, t0, t1, ImGuiCond_Always);
#elif defined(ImPlotAxis_X1)
        // Transitional versions
        ImPlot::SetupAxisLimits(ImPlotAxis_X1, t0, t1, ImGuiCond_Always);
#else
        // Very old ImPlot: DO NOT set limits (auto-fit fallback)
        // This avoids calling deprecated/nonexistent APIs.
#endif

        // --- Plot data ---
        ImPlot::PlotLine(label, xs, ys, count);

        ImPlot::EndPlot();
    }
}

static bool parse_flag_value(const char* s, double& out) {
    if (!s) return false;
    char* end = nullptr;
    const double v = std::strtod(s, &end);
    if (end == s || !std::isfinite(v)) return false;
    out = v;
    return true;
}

static void print_usage() {
    std::fprintf(stderr,
                 "kilnsim_vis [--setpoint C] [--kp v] [--ki v] [--kd v] [--manual pct]\n"
                 "            [--rpm v] [--dt s] [--speed sim_s_per_wall_s] [--couple-rpm] [--autostart]\n");
}

int main(int argc, char** argv) {
    // --- CLI flags (applied before the window opens so bad values fail fast) ---
    kiln::ConfigPatch cli_patch;
    double motor_rpm = 2.5;
    double dt = 1.0;
    double time_scale = 60.0;
    bool couple_rpm = false;
    bool autostart = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? argv[i] : "";
        double v = 0.0;
        const bool has_value = (i + 1 < argc);

        if (arg == "--couple-rpm") { couple_rpm = true; continue; }
        if (arg == "--autostart")  { autostart = true; continue; }
        if (arg == "--help" || arg == "-h") { print_usage(); return 0; }

        if (!has_value || !parse_flag_value(argv[i + 1], v)) {
            std::fprintf(stderr, "Invalid or missing value for %s\n", arg.c_str());
            print_usage();
            return EXIT_FAILURE;
        }
        ++i;

        kiln::PidGains g = cli_patch.gains ? *cli_patch.gains : kiln::defaultControllerConfig().gains;
        if (arg == "--setpoint")    cli_patch.setpoint_C = v;
        else if (arg == "--kp")     { g.Kp = v; cli_patch.gains = g; }
        else if (arg == "--ki")     { g.Ki = v; cli_patch.gains = g; }
        else if (arg == "--kd")     { g.Kd = v; cli_patch.gains = g; }
        else if (arg == "--manual") { cli_patch.manual_output = v; cli_patch.mode = kiln::ControlMode::Manual; }
        else if (arg == "--rpm")    motor_rpm = v;
        else if (arg == "--dt")     dt = v;
        else if (arg == "--speed")  time_scale = v;
        else {
            std::fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            print_usage();
            return EXIT_FAILURE;
        }
    }

    kiln::KilnSimulator sim;

    {
        const kiln::ConfigStatus st = sim.setConfig(cli_patch);
        if (!st.ok()) {
            std::fprintf(stderr, "Rejected controller flags (%s: %s)\n", st.field, kiln::toString(st.error));
            return EXIT_FAILURE;
        }
    }
    if (couple_rpm) {
        kiln::PlantParameters p = sim.plantParameters();
        p.heat_transfer_efficiency_0_1 = kiln::world::heatTransferEfficiency(motor_rpm);
        const kiln::ConfigStatus st = sim.resetToPlant(p);
        if (!st.ok()) {
            std::fprintf(stderr, "Rejected --rpm for heat transfer (%s: %s)\n", st.field, kiln::toString(st.error));
            return EXIT_FAILURE;
        }
    }
    if (autostart) sim.post(kiln::Command::start());
    (void)sim.getLatestEvents();

    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) return fail("glfwInit failed");

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

    GLFWwindow* window = glfwCreateWindow(1280, 720, "Kiln Control Simulator", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return fail("glfwCreateWindow failed");
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // vsync

    // Validate OpenGL context exists.
    const GLubyte* gl_version = glGetString(GL_VERSION);
    if (!gl_version) {
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("OpenGL context validation failed (glGetString(GL_VERSION) returned null)");
    }
    std::fprintf(stderr, "OpenGL Vendor:   %s\n", glGetString(GL_VENDOR));
    std::fprintf(stderr, "OpenGL Renderer: %s\n", glGetString(GL_RENDERER));
    std::fprintf(stderr, "OpenGL Version:  %s\n", gl_version);

    bool imgui_ctx = false;
    bool implot_ctx = false;
    bool imgui_glfw = false;
    bool imgui_gl3 = false;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    imgui_ctx = true;

    ImGuiIO& io = ImGui::GetIO();
#ifndef KILNSIM_NO_IMGUI_DOCKING
    io.ConfigFlags |= ImGuiConfigFlags_DockingEnable;
#endif
    ImGui::GetStyle().ScaleAllSizes(1.25f);
    io.FontGlobalScale = 1.25f;

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

    VisualUIState ui;

    // --- Camera (deterministic, ImGui-controlled) ---
    float cam_yaw_deg   = 35.0f;
    float cam_pitch_deg = 18.0f;
    float cam_dist      = 62.0f;

    // --- Shell (model-backed) ---
    kiln::world::KilnShell       shell;
    kiln::world::KilnShellInputs shell_in;
    shell_in.motor_rpm = motor_rpm;

    // --- UI-side edit buffers for the controller (posted as commands) ---
    kiln::ControllerConfig edit_cfg = sim.config();
    float edit_rpm = (float)motor_rpm;

    // Efficiency estimate inputs
    kiln::EfficiencyParameters eff_params;

    double wall_prev = glfwGetTime();
    double accum_s = 0.0;

    int last_substeps = 0;
    bool dropped_accum = false;

    // Diagnostics latched for the HUD; warnings are also logged once per occurrence.
    std::uint32_t hud_events = 0;
    double hud_events_wall_s = -1.0;
    kiln::TickStatus last_status = kiln::TickStatus::NotRunning;

    // Plot buffers (rebuilt from history() each frame)
    std::vector<kiln::Sample> hist;
    std::vector<double> t_hist, T_hist, SP_hist, U_hist, CO2_hist;

    auto log_events = [&](std::uint32_t ev) {
        if (ev & kiln::Warn_ConfigRejected) {
            std::fprintf(stderr, "WARN: configuration rejected, previous settings kept\n");
        }
        if (ev & kiln::Warn_InvalidTick) {
            std::fprintf(stderr, "WARN: tick skipped (invalid dt=%.6f)\n", dt);
        }
        if (ev & kiln::Event_Reset) {
            std::fprintf(stderr, "INFO: reset\n");
        }
        if (ev & kiln::Event_ModeChanged) {
            std::fprintf(stderr, "INFO: mode -> %s\n", kiln::toString(sim.config().mode));
        }
        if (ev != 0u) {
            hud_events |= ev;
            hud_events_wall_s = glfwGetTime();
        }
    };

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        // --- advance sim (wall-time accumulator) ---
        const double wall_now = glfwGetTime();
        double wall_dt = wall_now - wall_prev;
        wall_prev = wall_now;

        wall_dt = std::clamp(wall_dt, 0.0, 0.1);
        dt = std::clamp(dt, 0.1, 60.0);
        time_scale = std::clamp(time_scale, 1.0, 3600.0);

        // Commands posted by last frame's UI land here, even while stopped.
        const int rejected = sim.applyPendingCommands();
        if (rejected > 0) {
            std::fprintf(stderr, "WARN: %d queued config patch(es) rejected\n", rejected);
        }

        kiln::SimulationState st = sim.currentState();

        if (st.phase == kiln::RunPhase::Running) {
            accum_s += wall_dt * time_scale;

            constexpr int kMaxSubstepsPerFrame = 240;
            int substeps = 0;
            dropped_accum = false;

            while (accum_s >= dt && substeps < kMaxSubstepsPerFrame) {
                const kiln::TickResult r = sim.tick(dt);
                last_status = r.status;
                if (!r.has_sample) break;
                accum_s -= dt;
                ++substeps;
            }

            last_substeps = substeps;

            if (substeps == kMaxSubstepsPerFrame) {
                accum_s = 0.0;
                dropped_accum = true;
            }
        } else {
            accum_s = 0.0;
            last_substeps = 0;
            dropped_accum = false;
        }

        log_events(sim.getLatestEvents());
        if (hud_events_wall_s >= 0.0 && wall_now - hud_events_wall_s > 3.0) {
            hud_events = 0;
            hud_events_wall_s = -1.0;
        }

        st = sim.currentState();
        const kiln::ControllerConfig cfg = sim.config();

        hist = sim.history();
        t_hist.resize(hist.size());
        T_hist.resize(hist.size());
        SP_hist.resize(hist.size());
        U_hist.resize(hist.size());
        CO2_hist.resize(hist.size());
        for (std::size_t i = 0; i < hist.size(); ++i) {
            t_hist[i]   = hist[i].t_s;
            T_hist[i]   = hist[i].temperature_C;
            SP_hist[i]  = hist[i].setpoint_C;
            U_hist[i]   = hist[i].control_output;
            CO2_hist[i] = hist[i].emission_rate_kgph;
        }
        const std::uint32_t last_flags = hist.empty() ? 0u : hist.back().flags_u32;

        // Rotation is cosmetic: driven by simulated time only.
        shell_in.time_s = st.time_s;
        shell_in.motor_rpm = (double)edit_rpm;
        shell.recompute(shell_in);

        // --- ImGui frame ---
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

#ifndef KILNSIM_NO_IMGUI_DOCKING
        ImGui::DockSpaceOverViewport(ImGui::GetMainViewport());
#endif

        const ImVec4 header_col  = ImVec4(0.0f, 1.0f, 0.0f, 1.0f);
        const ImVec4 status_ok   = ImVec4(0.0f, 1.0f, 0.0f, 1.0f);
        const ImVec4 status_warn = ImVec4(1.0f, 1.0f, 0.0f, 1.0f);
        const ImVec4 status_fail = ImVec4(1.0f, 0.2f, 0.2f, 1.0f);

        // Dashboard overlay
        if (ui.show_hud) {
            ImGuiWindowFlags dashboard_flags =
                ImGuiWindowFlags_NoDecoration |
                ImGuiWindowFlags_AlwaysAutoResize |
                ImGuiWindowFlags_NoSavedSettings |
                ImGuiWindowFlags_NoFocusOnAppearing |
                ImGuiWindowFlags_NoNav;

            ImVec2 viewport_size = ImGui::GetMainViewport()->Size;
            ImGui::SetNextWindowPos(ImVec2(viewport_size.x - 12, 12), ImGuiCond_Always, ImVec2(1.0f, 0.0f));
            ImGui::SetNextWindowBgAlpha(0.85f);

            if (ImGui::Begin("##Dashboard", &ui.show_hud, dashboard_flags)) {
                ImGui::TextColored(header_col, "[ ROTARY KILN CONTROL ]");
                ImGui::Separator();

                ImVec4 phase_color = (st.phase == kiln::RunPhase::Running) ? status_ok
                                   : (st.phase == kiln::RunPhase::Stopped) ? status_warn
                                   : ImVec4(0.5f, 0.8f, 1.0f, 1.0f);
                ImGui::Text("TIME: %.0f s (%.1f min)", st.time_s, st.time_s / 60.0);
                ImGui::SameLine(220);
                ImGui::TextColored(phase_color, "[%s]", kiln::toString(st.phase));
                ImGui::Text("MODE: %s", kiln::toString(st.mode));
                ImGui::Spacing();

                ImGui::TextColored(header_col, "=== BURNING ZONE ===");
                const float temp_ratio = (float)std::clamp(st.temperature_C / 1800.0, 0.0, 1.0);
                ImGui::Text("Temp:     %.1f C", st.temperature_C);
                ImGui::SameLine(220);
                ImGui::ProgressBar(temp_ratio, ImVec2(200, 12), "");
                ImGui::Text("Setpoint: %.1f C", cfg.setpoint_C);

                const kiln::ClinkerQuality q = kiln::classifyClinker(st.temperature_C);
                ImGui::TextColored(clinker_color(q), "[ %s ]", kiln::toString(q));
                ImGui::Spacing();

                ImGui::TextColored(header_col, "=== BURNER ===");
                const float out_ratio = (float)std::clamp(st.control_output / 100.0, 0.0, 1.0);
                ImGui::Text("Output:   %.1f %%", st.control_output);
                ImGui::SameLine(220);
                ImGui::ProgressBar(out_ratio, ImVec2(200, 12), "");
                ImGui::Text("Fuel:     %.0f kg/h", kiln::fuelRateKgph(st.control_output, sim.emissionsParameters()));
                ImGui::Text("CO2:      %.0f kg/h", st.emission_rate_kgph);
                ImGui::Text("Shell:    %.2f rpm  (residence %.1f min)",
                            (double)edit_rpm, kiln::world::residenceTimeMinutes((double)edit_rpm));

                if ((last_flags & kiln::Flag_TemperatureSaturated) || (last_flags & kiln::Flag_OutputSaturated)) {
                    ImGui::Separator();
                    if (last_flags & kiln::Flag_TemperatureSaturated) {
                        ImGui::TextColored(status_fail, ">> TEMPERATURE AT ENVELOPE LIMIT");
                    }
                    if (last_flags & kiln::Flag_OutputSaturated) {
                        ImGui::TextColored(status_warn, ">> BURNER OUTPUT SATURATED");
                    }
                }
                if (hud_events & kiln::Warn_ConfigRejected) {
                    ImGui::TextColored(status_fail, ">> CONFIG REJECTED");
                }
                if (last_status == kiln::TickStatus::InvalidConfig) {
                    ImGui::TextColored(status_fail, ">> TICK SKIPPED: %s", kiln::toString(last_status));
                }
                if (dropped_accum) {
                    ImGui::TextColored(status_fail, ">> REALTIME DROPPED");
                }
            }
            ImGui::End();
        }

        // Control console
        if (ui.show_controls) {
            ImGui::SetNextWindowSize(ImVec2(560, 760), ImGuiCond_FirstUseEver);
            ImGui::Begin(">> CONTROL CONSOLE", &ui.show_controls);

            const ImVec4 cmd_header = ImVec4(0.0f, 1.0f, 0.0f, 1.0f);

            if (ImGui::BeginTabBar("ControlTabs", ImGuiTabBarFlags_None)) {

                // ===== TAB 1: EXECUTION =====
                if (ImGui::BeginTabItem("  EXEC  ")) {
                    ImGui::TextColored(cmd_header, "[EXEC] Transport Controls");
                    ImGui::Separator();

                    const bool running = (st.phase == kiln::RunPhase::Running);
                    if (ImGui::Button(running ? "  STOP  " : "  START  ", ImVec2(100, 0))) {
                        sim.post(running ? kiln::Command::stop() : kiln::Command::start());
                    }
                    ImGui::SameLine();
                    if (ImGui::Button("  STEP  ", ImVec2(100, 0)) && !running) {
                        sim.post(kiln::Command::start());
                        const kiln::TickResult r = sim.tick(dt);
                        last_status = r.status;
                        sim.post(kiln::Command::stop());
                        (void)sim.applyPendingCommands();
                        last_substeps = r.has_sample ? 1 : 0;
                    }
                    ImGui::SameLine();
                    if (ImGui::Button(" RESET ", ImVec2(100, 0))) {
                        sim.post(kiln::Command::reset());
                    }
                    if (ImGui::Button("[ RESET TO DEFAULTS ]", ImVec2(-1, 0))) {
                        sim.post(kiln::Command{kiln::Command::Kind::ResetWithDefaults, {}});
                        edit_cfg = kiln::defaultControllerConfig();
                    }

                    ImGui::Spacing();
                    float dt_slider = (float)dt;
                    ImGui::SliderFloat("Tick dt", &dt_slider, 0.1f, 30.0f, "%.1f s");
                    dt = (double)dt_slider;
                    float speed_slider = (float)time_scale;
                    ImGui::SliderFloat("Speed", &speed_slider, 1.0f, 1200.0f, "%.0f sim-s / s");
                    time_scale = (double)speed_slider;
                    ImGui::Spacing();

                    ImGui::TextColored(cmd_header, "[STATUS] Current State");
                    ImGui::Separator();
                    ImGui::Text("Ticks:       %llu", (unsigned long long)st.tick_count);
                    ImGui::Text("Last status: %s", kiln::toString(last_status));
                    ImGui::Text("Pending cmds: %d", (int)sim.pendingCommandCount());
                    const kiln::RunSignatures sig = sim.getRunSignatures();
                    ImGui::Text("Config hash: 0x%08X", sig.config_hash_u32);
                    ImGui::Text("History CRC: 0x%08X (%llu samples)",
                                sig.history_crc_u32, (unsigned long long)sig.samples_emitted_u64);
                    if (last_substeps > 0) {
                        ImGui::TextColored(ImVec4(0.0f, 1.0f, 1.0f, 1.0f), "Substeps:    %d", last_substeps);
                    }

                    if (ImGui::Button("[ DUMP CONFIG TO STDERR ]", ImVec2(-1, 0))) {
                        char buf[4096];
                        const int n = sim.exportConfigText(buf, (int)sizeof(buf));
                        std::fprintf(stderr, "%.*s", n, buf);
                    }

                    ImGui::EndTabItem();
                }

                // ===== TAB 2: CONTROLLER =====
                if (ImGui::BeginTabItem("  PID  ")) {
                    ImGui::TextColored(cmd_header, "[MODE]");
                    ImGui::Separator();

                    int mode_idx = (cfg.mode == kiln::ControlMode::Manual) ? 1 : 0;
                    if (ImGui::RadioButton("AUTO", &mode_idx, 0) | ImGui::RadioButton("MANUAL", &mode_idx, 1)) {
                        kiln::ConfigPatch p;
                        p.mode = (mode_idx == 1) ? kiln::ControlMode::Manual : kiln::ControlMode::Auto;
                        p.manual_output = edit_cfg.manual_output;
                        sim.post(kiln::Command::setConfig(p));
                        edit_cfg.mode = *p.mode;
                    }
                    ImGui::Spacing();

                    ImGui::TextColored(cmd_header, "[TUNING]");
                    ImGui::Separator();
                    float sp = (float)edit_cfg.setpoint_C;
                    float kp = (float)edit_cfg.gains.Kp;
                    float ki = (float)edit_cfg.gains.Ki;
                    float kd = (float)edit_cfg.gains.Kd;
                    float mo = (float)edit_cfg.manual_output;
                    float bmin = (float)edit_cfg.output_bounds.min;
                    float bmax = (float)edit_cfg.output_bounds.max;
                    ImGui::SliderFloat("Setpoint (C)", &sp, 1000.0f, 1600.0f, "%.0f");
                    ImGui::DragFloat("Kp", &kp, 0.01f, 0.0f, 10.0f, "%.3f");
                    ImGui::DragFloat("Ki (1/s)", &ki, 0.001f, 0.0f, 1.0f, "%.4f");
                    ImGui::DragFloat("Kd (s)", &kd, 0.1f, 0.0f, 100.0f, "%.2f");
                    ImGui::SliderFloat("Manual output (%)", &mo, 0.0f, 100.0f, "%.1f");
                    ImGui::DragFloat("Output min (%)", &bmin, 0.5f, 0.0f, 100.0f, "%.1f");
                    ImGui::DragFloat("Output max (%)", &bmax, 0.5f, 0.0f, 100.0f, "%.1f");
                    edit_cfg.setpoint_C = sp;
                    edit_cfg.gains = kiln::PidGains{kp, ki, kd};
                    edit_cfg.manual_output = mo;
                    edit_cfg.output_bounds = kiln::OutputBounds{bmin, bmax};

                    if (edit_cfg.output_bounds.min > edit_cfg.output_bounds.max) {
                        ImGui::TextColored(status_warn, "min > max: will be rejected");
                    }

                    if (ImGui::Button("[ APPLY ]", ImVec2(-1, 0))) {
                        kiln::ConfigPatch p;
                        p.setpoint_C = edit_cfg.setpoint_C;
                        p.gains = edit_cfg.gains;
                        p.manual_output = edit_cfg.manual_output;
                        p.output_bounds = edit_cfg.output_bounds;
                        sim.post(kiln::Command::setConfig(p));
                    }
                    if (ImGui::Button("[ REVERT EDITS ]", ImVec2(-1, 0))) {
                        edit_cfg = cfg;
                    }

                    ImGui::EndTabItem();
                }

                // ===== TAB 3: SHELL =====
                if (ImGui::BeginTabItem("  SHELL  ")) {
                    ImGui::TextColored(cmd_header, "[SHELL] Drive");
                    ImGui::Separator();
                    ImGui::SliderFloat("Motor speed (rpm)", &edit_rpm, 0.0f, 5.0f, "%.2f");
                    const double eff = kiln::world::heatTransferEfficiency((double)edit_rpm);
                    ImGui::Text("Residence:      %.1f min", kiln::world::residenceTimeMinutes((double)edit_rpm));
                    ImGui::Text("Heat transfer:  %.0f %%", 100.0 * eff);
                    ImGui::Text("Plant uses:     %.0f %%", 100.0 * sim.plantParameters().heat_transfer_efficiency_0_1);
                    ImGui::TextDisabled("Applying resets the run.");
                    if (ImGui::Button("[ APPLY SPEED TO PLANT ]", ImVec2(-1, 0))) {
                        kiln::PlantParameters p = sim.plantParameters();
                        p.heat_transfer_efficiency_0_1 = eff;
                        const kiln::ConfigStatus cs = sim.resetToPlant(p);
                        if (!cs.ok()) {
                            std::fprintf(stderr, "WARN: plant update rejected (%s: %s)\n",
                                         cs.field, kiln::toString(cs.error));
                        }
                    }
                    ImGui::Spacing();

                    ImGui::TextColored(cmd_header, "[VISUALIZATION] Draw Layers");
                    ImGui::Separator();
                    ImGui::Checkbox("Ground", &ui.draw_ground);
                    ImGui::Checkbox("Supports", &ui.draw_supports);
                    ImGui::Checkbox("Shell", &ui.draw_shell);
                    ImGui::Checkbox("Wireframe only", &ui.shell_wire_only);
                    ImGui::Checkbox("Seam marker", &ui.draw_seam_marker);
                    ImGui::Checkbox("Flame", &ui.draw_flame);
                    ImGui::SliderFloat("Camera yaw", &cam_yaw_deg, -180.0f, 180.0f, "%.0f deg");
                    ImGui::SliderFloat("Camera pitch", &cam_pitch_deg, -10.0f, 80.0f, "%.0f deg");
                    ImGui::SliderFloat("Camera dist", &cam_dist, 15.0f, 150.0f, "%.0f m");
                    ImGui::Text("Shell valid: %s   phase %.2f rad",
                                shell.isValid() ? "YES" : "NO", shell.geometry().phase_rad);

                    ImGui::EndTabItem();
                }

                // ===== TAB 4: PLOTS =====
                if (ImGui::BeginTabItem("  PLOTS  ")) {
                    const int count = (int)t_hist.size();

                    if (count > 1) {
                        const double t0 = t_hist.front();
                        const double t1 = t_hist.back();
                        ImGui::Text("Samples: %d / %d   Window: [%0.0f, %0.0f] s",
                                    count, sim.historyCapacity(), t0, t1);
                        ImGui::Separator();

                        if (ImPlot::BeginPlot("Temperature (C)")) {
                            #if defined(ImAxis_X1)
                            ImPlot::SetupAxisLimits(ImAxis_X1, t0, t1, ImGuiCond_Always);
                            #elif defined(ImPlotAxis_X1)
                            ImPlot::SetupAxisLimits(ImPlotAxis_X1, t0, t1, ImGuiCond_Always);
                            #else
                            #endif

                            ImPlot::PlotLine("T", t_hist.data(), T_hist.data(), count);
                            ImPlot::PlotLine("Setpoint", t_hist.data(), SP_hist.data(), count);

                            ImPlot::EndPlot();
                        }

                        plot_line_with_xlimits("Control output (%)", "u",
                                               t_hist.data(), U_hist.data(), count, t0, t1);

                        plot_line_with_xlimits("CO2 rate (kg/h)", "CO2",
                                               t_hist.data(), CO2_hist.data(), count, t0, t1);
                    } else {
                        ImGui::Text("Samples: %d", count);
                        ImGui::TextUnformatted("No data yet (press Start or Step).");
                    }

                    ImGui::EndTabItem();
                }

                // ===== TAB 5: EFFICIENCY =====
                if (ImGui::BeginTabItem("  EFFICIENCY  ")) {
                    ImGui::TextColored(cmd_header, "[EFFICIENCY] Annual Estimate");
                    ImGui::Separator();

                    float base = (float)eff_params.baseline_fuel_kgph;
                    float days = (float)eff_params.operating_days_per_year;
                    float price = (float)eff_params.fuel_price_per_tonne;
                    ImGui::DragFloat("Baseline fuel (kg/h)", &base, 5.0f, 0.0f, 2000.0f, "%.0f");
                    ImGui::DragFloat("Operating days", &days, 1.0f, 0.0f, 366.0f, "%.0f");
                    ImGui::DragFloat("Fuel price (/t)", &price, 0.5f, 0.0f, 500.0f, "%.1f");
                    eff_params.baseline_fuel_kgph = base;
                    eff_params.operating_days_per_year = days;
                    eff_params.fuel_price_per_tonne = price;
                    eff_params.co2_per_kg_fuel = sim.emissionsParameters().co2_per_kg_fuel;

                    const kiln::RunSummary summary = kiln::summarizeRun(hist, sim.emissionsParameters(),
                                                                        hist.empty() ? 0.0 : hist.front().t_s);
                    const double fuel_now = (summary.sample_count > 1)
                        ? summary.mean_fuel_kgph
                        : kiln::fuelRateKgph(st.control_output, sim.emissionsParameters());
                    const kiln::EfficiencyEstimate e = kiln::estimateEfficiency(fuel_now, eff_params);

                    ImGui::Spacing();
                    ImGui::Text("Mean fuel (window): %.0f kg/h", fuel_now);
                    ImVec4 c = (e.fuel_saved_kg_per_year >= 0.0) ? status_ok : status_fail;
                    ImGui::TextColored(c, "Fuel saved:   %.1f t/yr", e.fuel_saved_kg_per_year / 1000.0);
                    ImGui::TextColored(c, "CO2 avoided:  %.1f t/yr", e.co2_avoided_kg_per_year / 1000.0);
                    ImGui::TextColored(c, "Cost saved:   %.0f /yr", e.money_saved_per_year);
                    ImGui::Spacing();

                    ImGui::TextColored(cmd_header, "[WINDOW] Run Summary");
                    ImGui::Separator();
                    ImGui::Text("Peak:      %.1f C", summary.peak_temperature_C);
                    ImGui::Text("Overshoot: %.1f C", summary.overshoot_C);
                    if (summary.settling_time_s >= 0.0) {
                        ImGui::Text("Settled:   after %.0f s", summary.settling_time_s);
                    } else {
                        ImGui::Text("Settled:   no");
                    }
                    ImGui::Text("IAE:       %.3g C*s", summary.iae_C_s);
                    ImGui::Text("CO2:       %.1f t", summary.total_co2_kg / 1000.0);
                    ImGui::Text("Saturated: %d temperature / %d output",
                                summary.saturated_samples, summary.output_saturated_samples);

                    ImGui::EndTabItem();
                }

                ImGui::EndTabBar();
            }

            ImGui::End();
        }

        ImGui::Render();

        int fb_w = 0, fb_h = 0;
        glfwGetFramebufferSize(window, &fb_w, &fb_h);

        if (fb_w > 0 && fb_h > 0) {
            glViewport(0, 0, fb_w, fb_h);
            glEnable(GL_DEPTH_TEST);
            glDepthFunc(GL_LESS);
            glDisable(GL_CULL_FACE);

            glClearColor(0.06f, 0.06f, 0.07f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

            const float aspect = (fb_h > 0) ? (float)fb_w / (float)fb_h : 1.0f;
            set_perspective(50.0f, aspect, 0.5f, 500.0f);

            const kiln::world::KilnShellGeometry& geo = shell.geometry();
            const Vec3f feed = to_v3f(geo.feed_end_m);
            const Vec3f burner = to_v3f(geo.burner_end_m);
            const Vec3f cam_target = mul(add(feed, burner), 0.5f);

            const float yaw   = cam_yaw_deg   * 3.1415926535f / 180.0f;
            const float pitch = cam_pitch_deg * 3.1415926535f / 180.0f;

            Vec3f eye = v3(
                cam_target.x + cam_dist * std::cos(pitch) * std::sin(yaw),
                cam_target.y + cam_dist * std::sin(pitch),
                cam_target.z + cam_dist * std::cos(pitch) * std::cos(yaw)
            );
            look_at(eye, cam_target, v3(0.0f, 1.0f, 0.0f));

            const float radius = (float)shell.config().radius_m;

            if (ui.draw_ground) {
                glColor3f(0.25f, 0.25f, 0.28f);
                draw_wire_box(v3(cam_target.x, -0.05f, 0.0f),
                              v3(0.5f * (float)shell.config().length_m + 6.0f, 0.05f, 2.5f * radius));
            }

            if (shell.isValid()) {
                if (ui.draw_supports) {
                    // Tyre piers at 20/50/80 % of the length
                    const float fr[3] = {0.2f, 0.5f, 0.8f};
                    for (int i = 0; i < 3; ++i) {
                        const Vec3f axis = add(feed, mul(sub(burner, feed), fr[i]));
                        const float pier_h = axis.y - radius;
                        if (pier_h <= 0.0f) continue;
                        const Vec3f c = v3(axis.x, 0.5f * pier_h, 0.0f);
                        const Vec3f h = v3(0.8f, 0.5f * pier_h, 0.9f * radius);
                        glColor3f(0.35f, 0.35f, 0.38f);
                        draw_solid_box(c, h);
                        glColor3f(0.10f, 0.10f, 0.10f);
                        draw_wire_box(c, h);
                    }
                }

                if (ui.draw_shell) {
                    draw_kiln_shell(geo, (float)st.temperature_C, ui.shell_wire_only);
                }

                if (ui.draw_seam_marker) {
                    glColor3f(0.95f, 0.95f, 0.95f);
                    const Vec3f m = to_v3f(geo.seam_marker_m);
                    draw_solid_box(m, v3(0.35f, 0.35f, 0.35f));
                }

                if (ui.draw_flame && st.control_output > 1e-3) {
                    const float u = clampf((float)(st.control_output / 100.0), 0.0f, 1.0f);
                    const float flame_len = 2.0f + 12.0f * u;
                    const float flame_rad = clampf(0.3f + 1.4f * u, 0.0f, 0.9f * radius);
                    glColor3f(1.0f, 0.45f + 0.4f * u, 0.10f);
                    draw_cone_world(burner, sub(feed, burner), flame_len, flame_rad, 18);
                }
            }

            glDisable(GL_DEPTH_TEST);
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
