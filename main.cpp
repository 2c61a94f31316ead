/*
 * Xiaomi Gateway Bridge (local monitor)
 *
 * Architecture:
 * 1. Main Thread: Runs the Dear ImGui loop (Local Visualization).
 * 2. GatewayBridge: Central context object. Owns the Asio io_context and its
 *    worker pool, the discovery service, the hub table and the device registry.
 * 3. Discovery: whois multicast to 224.0.0.50:4321 plus static gateway entries,
 *    retried up to "discovery_retry" rounds.
 * 4. Push Listener: own thread bound to UDP 9898 (multicast group joined).
 *    Reports and heartbeats are routed by source IP and decoded on the pool.
 * 5. Device Registry: per sub-device decoder, battery level and an
 *    availability timer on a strand.
 * 6. Commands: UI buttons post hub writes and miIO calls to the pool.
 */

#include <iostream>
#include <memory>
#include <string>

// --- Dear ImGui Includes ---
#include <GL/glew.h>
#include <GL/gl.h>
#include <GLFW/glfw3.h>
#include "imgui.h"
#include "backends/imgui_impl_glfw.h"
#include "backends/imgui_impl_opengl3.h"

#include "GatewayBridge.h"
#include "GatewayUI.h"
#include "HubConfig.h"
#include "HubErrors.h"
#include "Logging.h"

// =================================================================================
//
// Main Function
//
// =================================================================================

static void glfw_error_callback(int error, const char* description) {
    fprintf(stderr, "Glfw Error %d: %s\n", error, description);
    AddLog(std::string("Glfw Error: ") + description);
}

int main(int argc, char** argv) {
    // --- 0. Configuration ---
    const std::string config_path = (argc > 1) ? argv[1] : "migateway.json";
    std::unique_ptr<GatewayBridge> bridge;
    try {
        bridge = std::make_unique<GatewayBridge>(LoadBridgeConfig(config_path));
    }
    catch (const HubError& e) {
        std::cerr << "Config Error: " << e.what() << std::endl;
        return 1;
    }

    // --- 1. Setup GLFW ---
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit())
        return 1;

    // --- 2. Setup Window + OpenGL + GLEW ---
    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 2);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);

    GLFWwindow* window = glfwCreateWindow(1280, 720, "Xiaomi Gateway Bridge", NULL, NULL);
    if (window == NULL)
        return 1;
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // Enable vsync

    if (glewInit() != GLEW_OK) {
        fprintf(stderr, "Failed to initialize GLEW\n");
        return 1;
    }

    // --- 3. Setup Dear ImGui ---
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO(); (void)io;
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    ImGui::StyleColorsDark();

    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init(glsl_version);

    // --- 4. Start the Bridge ---
    // A failed discovery keeps the window open so the log can be read
    try {
        bridge->Start();
    }
    catch (const HubError& e) {
        AddLog(std::string("System Error: Bridge failed to start: ") + e.what());
        PushNotification("Bridge failed to start", false);
    }

    // --- 5. Main Render Loop ---
    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        DrawGatewayUI(*bridge);

        ImGui::Render();
        int display_w, display_h;
        glfwGetFramebufferSize(window, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        glClearColor(0.45f, 0.55f, 0.60f, 1.00f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(window);
    }

    // --- 6. Cleanup ---
    bridge->Stop();

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();

    return 0;
}
