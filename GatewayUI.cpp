#include "GatewayUI.h"
#include "GatewayBridge.h"
#include "HubErrors.h"
#include "Logging.h"

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

// =================================================================================
//
// Dear ImGui UI Rendering
//
// =================================================================================

namespace {

// Hub commands block for up to two timeouts, run them on the bridge pool
void RunCommand(GatewayBridge& bridge, const std::string& label, std::function<bool()> action) {
    boost::asio::post(bridge.GetIoContext(), [label, action = std::move(action)]() {
        try {
            bool ok = action();
            PushNotification(label + (ok ? " done" : " failed"), ok);
        }
        catch (const HubError& e) {
            AddLog("UI Error: " + label + ": " + e.what());
            PushNotification(label + ": " + e.what(), false);
        }
        catch (const std::invalid_argument& e) {
            PushNotification(label + ": " + e.what(), false);
        }
        });
}

void DrawLogTab() {
    if (ImGui::Button("Clear Log")) {
        ClearLogs();
    }
    ImGui::SameLine();
    static bool show_ingress = g_log_show_ingress;
    static bool show_egress = g_log_show_egress;
    ImGui::Checkbox("Show Hub -> Bridge (Ingress)", &show_ingress);
    ImGui::SameLine();
    ImGui::Checkbox("Show Bridge -> Hub (Egress)", &show_egress);
    g_log_show_ingress = show_ingress;
    g_log_show_egress = show_egress;

    static size_t last_log_count = 0;
    std::vector<std::string> logs = GetLogSnapshot();
    bool scroll_to_bottom = (logs.size() != last_log_count);
    last_log_count = logs.size();
    ImGui::BeginChild("LogScroll", ImVec2(0, -ImGui::GetFrameHeightWithSpacing()), false, ImGuiWindowFlags_HorizontalScrollbar);
    ImGui::PushStyleVar(ImGuiStyleVar_ItemSpacing, ImVec2(4, 1));
    for (const auto& log : logs) {
        ImGui::TextUnformatted(log.c_str());
    }
    if (scroll_to_bottom) {
        ImGui::SetScrollHereY(1.0f);
    }
    ImGui::PopStyleVar();
    ImGui::EndChild();
}

void DrawGatewaysTab(GatewayBridge& bridge) {
    auto gateways = bridge.GetGatewayList();
    ImGui::Text("Gateways: %zu", gateways.size());

    if (ImGui::BeginTable("GatewayTable", 6, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg | ImGuiTableFlags_Resizable)) {
        ImGui::TableSetupColumn("Gateway SID");
        ImGui::TableSetupColumn("Address");
        ImGui::TableSetupColumn("Protocol");
        ImGui::TableSetupColumn("State");
        ImGui::TableSetupColumn("Control");
        ImGui::TableSetupColumn("Token");
        ImGui::TableHeadersRow();
        for (const auto& gw : gateways) {
            ImGui::PushID(gw->GetSid().c_str());
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0); ImGui::Text("%s", gw->GetSid().c_str());
            ImGui::TableSetColumnIndex(1); ImGui::Text("%s:%u", gw->GetIp().c_str(), gw->GetPort());
            ImGui::TableSetColumnIndex(2); ImGui::Text("%s", gw->GetProto().empty() ? "1.x" : gw->GetProto().c_str());
            ImGui::TableSetColumnIndex(3); ImGui::Text("%s", SessionStateName(gw->GetState()).c_str());
            ImGui::TableSetColumnIndex(4);
            if (gw->HasKey()) ImGui::TextColored(ImVec4(0, 1, 0, 1), "Key set");
            else ImGui::TextColored(ImVec4(1, 1, 0, 1), "Read-only");
            ImGui::TableSetColumnIndex(5); ImGui::Text("%s", gw->GetToken().c_str());
            ImGui::PopID();
        }
        ImGui::EndTable();
    }

    ImGui::Spacing(); ImGui::SeparatorText("Gateway Services");

    static char gw_sid_buf[32] = "";
    static int ringtone_id = 0;
    static int ringtone_vol = 50;
    static char device_id_buf[32] = "";
    static int radio_volume = 50;

    ImGui::PushItemWidth(200);
    ImGui::InputText("Gateway SID (empty = only gateway)", gw_sid_buf, IM_ARRAYSIZE(gw_sid_buf));
    ImGui::PopItemWidth();

    const std::string gw_sid = gw_sid_buf;
    GatewayServices& services = bridge.Services();

    ImGui::PushItemWidth(100);
    ImGui::InputInt("Ringtone ID", &ringtone_id);
    ImGui::SameLine();
    ImGui::SliderInt("Volume##Ringtone", &ringtone_vol, 0, 100);
    ImGui::PopItemWidth();
    bool reserved = GatewayServices::IsReservedRingtone(ringtone_id);
    ImGui::BeginDisabled(reserved);
    if (ImGui::Button("Play Ringtone")) {
        int id = ringtone_id, vol = ringtone_vol;
        RunCommand(bridge, "Play ringtone", [&services, gw_sid, id, vol]() { return services.PlayRingtone(gw_sid, id, vol); });
    }
    ImGui::EndDisabled();
    if (reserved) {
        ImGui::SameLine();
        ImGui::TextDisabled("(ids 9 and 14-19 are reserved)");
    }
    ImGui::SameLine();
    if (ImGui::Button("Stop Ringtone")) {
        RunCommand(bridge, "Stop ringtone", [&services, gw_sid]() { return services.StopRingtone(gw_sid); });
    }

    if (ImGui::Button("Allow Pairing (30 s)")) {
        RunCommand(bridge, "Add device", [&services, gw_sid]() { return services.AddDevice(gw_sid); });
    }

    ImGui::PushItemWidth(200);
    ImGui::InputText("Device ID##Remove", device_id_buf, IM_ARRAYSIZE(device_id_buf));
    ImGui::PopItemWidth();
    ImGui::SameLine();
    if (ImGui::Button("Remove Device")) {
        std::string device_id = device_id_buf;
        RunCommand(bridge, "Remove device", [&services, gw_sid, device_id]() { return services.RemoveDevice(gw_sid, device_id); });
    }

    ImGui::PushItemWidth(200);
    ImGui::SliderInt("Radio Volume", &radio_volume, 0, 100);
    ImGui::PopItemWidth();
    ImGui::SameLine();
    if (ImGui::Button("Apply##Radio")) {
        int vol = radio_volume;
        RunCommand(bridge, "Radio volume", [&services, gw_sid, vol]() { return services.RadioVolume(gw_sid, vol); });
    }
    if (ImGui::Button("Radio On")) {
        RunCommand(bridge, "Radio on", [&bridge, gw_sid]() { return bridge.SetRadioPower(gw_sid, true); });
    }
    ImGui::SameLine();
    if (ImGui::Button("Radio Off")) {
        RunCommand(bridge, "Radio off", [&bridge, gw_sid]() { return bridge.SetRadioPower(gw_sid, false); });
    }
    ImGui::SameLine();
    if (ImGui::Button("Refresh##Radio")) {
        RunCommand(bridge, "Radio refresh", [&bridge, gw_sid]() { bridge.RefreshRadio(gw_sid); return true; });
    }
    ImGui::TextDisabled("Radio state is shown in the gateway's row of the Devices tab");
}

void DrawDevicesTab(GatewayBridge& bridge) {
    auto devices = bridge.Devices().Snapshot();
    ImGui::Text("Sub-devices: %zu", devices.size());

    if (ImGui::BeginTable("DeviceTable", 6, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg | ImGuiTableFlags_Resizable)) {
        ImGui::TableSetupColumn("Device ID");
        ImGui::TableSetupColumn("Model");
        ImGui::TableSetupColumn("Gateway");
        ImGui::TableSetupColumn("Available");
        ImGui::TableSetupColumn("Attributes (JSON)");
        ImGui::TableSetupColumn("Actions", ImGuiTableColumnFlags_WidthFixed, 220.0f);
        ImGui::TableHeadersRow();
        for (const auto& dev : devices) {
            ImGui::PushID(dev.sid.c_str());
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0); ImGui::Text("%s", dev.sid.c_str());
            ImGui::TableSetColumnIndex(1);
            ImGui::Text("%s", dev.name.empty() ? dev.model.c_str() : (dev.name + " (" + dev.model + ")").c_str());
            ImGui::TableSetColumnIndex(2); ImGui::Text("%s", dev.hub_sid.c_str());
            ImGui::TableSetColumnIndex(3);
            if (dev.available) ImGui::TextColored(ImVec4(0, 1, 0, 1), "Online");
            else ImGui::TextColored(ImVec4(1, 0, 0, 1), "Unavailable");
            ImGui::TableSetColumnIndex(4); ImGui::Text("%s", dev.attributes.dump().c_str());

            ImGui::TableSetColumnIndex(5);
            auto descriptor = bridge.Devices().GetDescriptor(dev.sid);
            if (descriptor && descriptor->encode_command) {
                const std::string sid = dev.sid;
                for (const auto& channel : dev.data_keys) {
                    ImGui::PushID(channel.c_str());
                    if (ImGui::SmallButton("On")) {
                        RunCommand(bridge, sid + " " + channel + " on", [&bridge, sid, channel]() { return bridge.WriteSubDevice(sid, channel, true); });
                    }
                    ImGui::SameLine();
                    if (ImGui::SmallButton("Off")) {
                        RunCommand(bridge, sid + " " + channel + " off", [&bridge, sid, channel]() { return bridge.WriteSubDevice(sid, channel, false); });
                    }
                    ImGui::SameLine();
                    ImGui::TextDisabled("%s", channel.c_str());
                    ImGui::PopID();
                }
            }
            else {
                ImGui::TextDisabled("read-only");
            }
            ImGui::PopID();
        }
        ImGui::EndTable();
    }
}

} // namespace

void DrawGatewayUI(GatewayBridge& bridge) {
    ImGui::SetNextWindowSize(ImVec2(1000, 700), ImGuiCond_FirstUseEver);
    ImGui::Begin("Xiaomi Gateway Bridge");

    ImGui::Text("Bridge:");
    ImGui::SameLine();
    if (bridge.IsRunning()) {
        ImGui::TextColored(ImVec4(0, 1, 0, 1), "Listening on interface %s, port %u", bridge.GetConfig().interface.c_str(), static_cast<unsigned>(bridge.GetPushPort()));
    }
    else {
        ImGui::TextColored(ImVec4(1, 0, 0, 1), "Stopped.");
    }
    ImGui::Separator();

    if (ImGui::BeginTabBar("MainTabs")) {
        if (ImGui::BeginTabItem("Live Log")) {
            DrawLogTab();
            ImGui::EndTabItem();
        }
        if (ImGui::BeginTabItem("Gateways")) {
            DrawGatewaysTab(bridge);
            ImGui::EndTabItem();
        }
        if (ImGui::BeginTabItem("Devices")) {
            DrawDevicesTab(bridge);
            ImGui::EndTabItem();
        }
        ImGui::EndTabBar();
    }

    // --- Notification Overlay ---
    ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(ImVec2(viewport->WorkPos.x + viewport->WorkSize.x - 10, viewport->WorkPos.y + viewport->WorkSize.y - 10), ImGuiCond_Always, ImVec2(1.0f, 1.0f));
    ImGui::SetNextWindowBgAlpha(0.35f);
    if (ImGui::Begin("Notifications", nullptr, ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoFocusOnAppearing | ImGuiWindowFlags_NoNav)) {
        for (const auto& n : GetActiveNotifications()) {
            ImVec4 color = n.is_success ? ImVec4(0, 1, 0, 1) : ImVec4(1, 0, 0, 1);
            ImGui::TextColored(color, "%s", n.message.c_str());
        }
    }
    ImGui::End();
    ImGui::End();
}
