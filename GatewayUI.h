// GatewayUI.h
#pragma once
// --- Dear ImGui Includes ---
#include <GL/glew.h>
#include <GL/gl.h>
#include <GLFW/glfw3.h>
#include "imgui.h"
#include "backends/imgui_impl_glfw.h"
#include "backends/imgui_impl_opengl3.h"

#ifdef _WIN32
#include <GLFW/glfw3native.h>
#endif

class GatewayBridge; // Forward declaration

void DrawGatewayUI(GatewayBridge& bridge);
