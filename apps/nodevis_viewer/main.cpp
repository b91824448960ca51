#include <algorithm>
#include <array>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <GLFW/glfw3.h>
#include <fmt/format.h>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>
#include <opencv2/core.hpp>
#include <spdlog/spdlog.h>

#include "nodevis/common/version.hpp"
#include "nodevis/scene/session.hpp"
#include "nodevis/scene/viewer_config.hpp"
#include "nodevis/shell/desktop_entry.hpp"

namespace {

// Half extents of the sensor board drawn for every node.
const cv::Vec3d kBoardHalfExtents(0.06, 0.04, 0.012);
constexpr double kAxisLength = 0.09;
constexpr float kSpinMarkerRadius = 6.0F;

struct ViewBasis {
  cv::Vec3d eye;
  cv::Vec3d right;
  cv::Vec3d up;
  cv::Vec3d forward;
};

struct MouseGestureBinding {
  ImGuiMouseButton button;
  nodevis::scene::GestureKind begin;
  nodevis::scene::GestureKind drag;
  nodevis::scene::GestureKind end;
};

constexpr std::array<MouseGestureBinding, 3> kMouseBindings = {{
    {ImGuiMouseButton_Left, nodevis::scene::GestureKind::kRotateBegin, nodevis::scene::GestureKind::kRotateDrag,
     nodevis::scene::GestureKind::kRotateEnd},
    {ImGuiMouseButton_Middle, nodevis::scene::GestureKind::kPanBegin, nodevis::scene::GestureKind::kPanDrag,
     nodevis::scene::GestureKind::kPanEnd},
    {ImGuiMouseButton_Right, nodevis::scene::GestureKind::kZoomBegin, nodevis::scene::GestureKind::kZoomDrag,
     nodevis::scene::GestureKind::kZoomEnd},
}};

ViewBasis MakeViewBasis(const nodevis::scene::CameraPose& pose) {
  ViewBasis basis;
  basis.eye = pose.eye;
  basis.forward = cv::normalize(pose.focal_point - pose.eye);
  basis.right = cv::normalize(basis.forward.cross(pose.view_up));
  basis.up = cv::normalize(basis.right.cross(basis.forward));
  return basis;
}

bool ProjectWorldPoint(const cv::Vec3d& point_world,
                       const ViewBasis& basis,
                       const ImVec2& canvas_center,
                       float focal_pixels,
                       ImVec2* projected_point) {
  const cv::Vec3d relative = point_world - basis.eye;

  const double view_x = relative.dot(basis.right);
  const double view_y = relative.dot(basis.up);
  const double view_z = relative.dot(basis.forward);
  if (view_z <= 0.001) {
    return false;
  }

  projected_point->x = canvas_center.x + static_cast<float>(view_x / view_z) * focal_pixels;
  projected_point->y = canvas_center.y - static_cast<float>(view_y / view_z) * focal_pixels;
  return true;
}

void DrawSegment(ImDrawList* draw_list,
                 const ViewBasis& basis,
                 const ImVec2& canvas_center,
                 float focal_pixels,
                 const cv::Vec3d& start,
                 const cv::Vec3d& end,
                 ImU32 color,
                 float thickness) {
  ImVec2 start_2d;
  ImVec2 end_2d;
  if (!ProjectWorldPoint(start, basis, canvas_center, focal_pixels, &start_2d)) {
    return;
  }
  if (!ProjectWorldPoint(end, basis, canvas_center, focal_pixels, &end_2d)) {
    return;
  }
  draw_list->AddLine(start_2d, end_2d, color, thickness);
}

void DrawNode(ImDrawList* draw_list,
              const ViewBasis& basis,
              const ImVec2& canvas_center,
              float focal_pixels,
              const nodevis::scene::NodePose& pose,
              bool selected) {
  std::array<cv::Vec3d, 8> corners;
  for (std::size_t index = 0; index < corners.size(); ++index) {
    const cv::Vec3d local((index & 1U) != 0 ? kBoardHalfExtents[0] : -kBoardHalfExtents[0],
                          (index & 2U) != 0 ? kBoardHalfExtents[1] : -kBoardHalfExtents[1],
                          (index & 4U) != 0 ? kBoardHalfExtents[2] : -kBoardHalfExtents[2]);
    corners[index] = pose.rotation * local + pose.slot_position;
  }

  const ImU32 board_color = selected ? IM_COL32(255, 220, 90, 255) : IM_COL32(200, 200, 210, 255);
  constexpr std::array<std::array<int, 2>, 12> kEdges = {{
      {0, 1}, {2, 3}, {4, 5}, {6, 7}, {0, 2}, {1, 3}, {4, 6}, {5, 7}, {0, 4}, {1, 5}, {2, 6}, {3, 7},
  }};
  for (const auto& edge : kEdges) {
    DrawSegment(draw_list, basis, canvas_center, focal_pixels, corners[edge[0]], corners[edge[1]], board_color, 1.5F);
  }

  const cv::Matx33d axes = pose.axis_orientation.toRotMat3x3(cv::QUAT_ASSUME_UNIT);
  constexpr std::array<ImU32, 3> kAxisColors = {
      IM_COL32(255, 70, 70, 255), IM_COL32(80, 255, 80, 255), IM_COL32(80, 160, 255, 255)};
  for (int axis = 0; axis < 3; ++axis) {
    const cv::Vec3d direction(axes(0, axis), axes(1, axis), axes(2, axis));
    DrawSegment(draw_list, basis, canvas_center, focal_pixels, pose.slot_position,
                pose.slot_position + direction * kAxisLength, kAxisColors[static_cast<std::size_t>(axis)], 2.0F);
  }

  ImVec2 label_2d;
  if (ProjectWorldPoint(pose.label_position, basis, canvas_center, focal_pixels, &label_2d)) {
    draw_list->AddText(ImGui::GetFont(), ImGui::GetFontSize() * 1.4F, label_2d, IM_COL32(255, 255, 0, 255),
                       pose.label.c_str());
  }
}

void DrawSpinCenter(ImDrawList* draw_list,
                    const ViewBasis& basis,
                    const ImVec2& canvas_center,
                    float focal_pixels,
                    const cv::Vec3d& focal_point) {
  ImVec2 marker;
  if (!ProjectWorldPoint(focal_point, basis, canvas_center, focal_pixels, &marker)) {
    return;
  }
  draw_list->AddCircle(marker, kSpinMarkerRadius, IM_COL32(255, 120, 40, 255), 16, 2.0F);
  draw_list->AddLine(ImVec2(marker.x - 2.0F * kSpinMarkerRadius, marker.y),
                     ImVec2(marker.x + 2.0F * kSpinMarkerRadius, marker.y), IM_COL32(255, 120, 40, 200), 1.0F);
  draw_list->AddLine(ImVec2(marker.x, marker.y - 2.0F * kSpinMarkerRadius),
                     ImVec2(marker.x, marker.y + 2.0F * kSpinMarkerRadius), IM_COL32(255, 120, 40, 200), 1.0F);
}

void ForwardMouseGestures(bool hovered, nodevis::scene::Session* session) {
  const ImGuiIO& io = ImGui::GetIO();
  for (const auto& binding : kMouseBindings) {
    if (hovered && ImGui::IsMouseClicked(binding.button)) {
      session->DispatchGesture({binding.begin});
    }
    if (ImGui::IsMouseDown(binding.button) && (io.MouseDelta.x != 0.0F || io.MouseDelta.y != 0.0F)) {
      session->DispatchGesture({binding.drag, io.MouseDelta.x, io.MouseDelta.y});
    }
    if (ImGui::IsMouseReleased(binding.button)) {
      session->DispatchGesture({binding.end});
    }
  }
  if (hovered && io.MouseWheel != 0.0F) {
    session->DispatchGesture({nodevis::scene::GestureKind::kScroll, 0.0, 0.0, io.MouseWheel});
  }
}

void HandleKeyboard(nodevis::scene::Session* session) {
  const ImGuiIO& io = ImGui::GetIO();
  if (io.WantTextInput || !session->has_dataset()) {
    return;
  }

  if (io.KeyCtrl) {
    for (int node_id = 1; node_id <= 8; ++node_id) {
      if (ImGui::IsKeyPressed(static_cast<ImGuiKey>(ImGuiKey_0 + node_id), false)) {
        session->JumpToNode(node_id);
      }
    }
  }
  if (ImGui::IsKeyPressed(ImGuiKey_Space, false)) {
    session->TogglePlaying();
  }
  if (ImGui::IsKeyPressed(ImGuiKey_RightArrow)) {
    session->Step(1);
  }
  if (ImGui::IsKeyPressed(ImGuiKey_LeftArrow)) {
    session->Step(-1);
  }
  if (ImGui::IsKeyPressed(ImGuiKey_Home, false)) {
    session->Seek(0);
  }
  if (ImGui::IsKeyPressed(ImGuiKey_End, false)) {
    session->Seek(static_cast<long long>(session->frame_count()) - 1);
  }
  if (!io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_R, false)) {
    session->ResetCamera();
  }
}

void DrawScene(nodevis::scene::Session* session) {
  ImVec2 canvas_size = ImGui::GetContentRegionAvail();
  canvas_size.x = std::max(canvas_size.x, 320.0F);
  canvas_size.y = std::max(canvas_size.y, 260.0F);

  const ImVec2 canvas_min = ImGui::GetCursorScreenPos();
  const ImVec2 canvas_max(canvas_min.x + canvas_size.x, canvas_min.y + canvas_size.y);
  ImGui::InvisibleButton("scene_canvas", canvas_size, ImGuiButtonFlags_MouseButtonLeft | ImGuiButtonFlags_MouseButtonRight | ImGuiButtonFlags_MouseButtonMiddle);
  const bool hovered = ImGui::IsItemHovered();

  ImDrawList* draw_list = ImGui::GetWindowDrawList();
  draw_list->AddRectFilledMultiColor(canvas_min, canvas_max, IM_COL32(51, 51, 51, 255), IM_COL32(51, 51, 51, 255),
                                     IM_COL32(77, 77, 77, 255), IM_COL32(77, 77, 77, 255));
  draw_list->PushClipRect(canvas_min, canvas_max, true);

  ForwardMouseGestures(hovered, session);

  const ViewBasis basis = MakeViewBasis(session->camera_pose());
  const ImVec2 canvas_center((canvas_min.x + canvas_max.x) * 0.5F, (canvas_min.y + canvas_max.y) * 0.5F);
  const float focal_pixels = 0.9F * std::min(canvas_size.x, canvas_size.y);

  const auto selected = session->timeline().selected_node();
  for (const auto& pose : session->CurrentPoses()) {
    DrawNode(draw_list, basis, canvas_center, focal_pixels, pose, selected == pose.node_id);
  }
  DrawSpinCenter(draw_list, basis, canvas_center, focal_pixels, session->camera_pose().focal_point);

  const std::string frame_text = session->has_dataset() ? fmt::format("Frame: {}", session->current_frame()) : "No data";
  draw_list->AddText(ImGui::GetFont(), ImGui::GetFontSize() * 2.0F, ImVec2(canvas_min.x + 20.0F, canvas_min.y + 16.0F),
                     IM_COL32(255, 255, 255, 255), frame_text.c_str());
  draw_list->PopClipRect();
}

void DrawControls(nodevis::scene::Session* session,
                  std::array<char, 1024>* path_buffer,
                  std::string* load_error) {
  if (session->has_dataset()) {
    if (ImGui::Button(session->playing() ? "Pause" : "Play")) {
      session->TogglePlaying();
    }
    ImGui::SameLine();
    int frame = static_cast<int>(session->current_frame());
    const int last_frame = static_cast<int>(session->frame_count()) - 1;
    ImGui::SetNextItemWidth(-1.0F);
    if (ImGui::SliderInt("##frame", &frame, 0, last_frame, "Frame %d")) {
      session->Seek(frame);
    }
  }

  ImGui::SetNextItemWidth(std::max(200.0F, ImGui::GetContentRegionAvail().x - 260.0F));
  ImGui::InputText("##path", path_buffer->data(), path_buffer->size());
  ImGui::SameLine();
  if (ImGui::Button("Load")) {
    try {
      session->Load(path_buffer->data());
      load_error->clear();
    } catch (const std::exception& ex) {
      spdlog::error("Failed to load dataset: {}", ex.what());
      *load_error = ex.what();
    }
  }
  ImGui::SameLine();
  ImGui::TextDisabled("Ctrl+1..8 jump, R reset, Space play");
  if (!load_error->empty()) {
    ImGui::TextColored(ImVec4(1.0F, 0.4F, 0.4F, 1.0F), "%s", load_error->c_str());
  }
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App app{"nodevis multi-sensor orientation playback viewer"};
  std::string data_path;
  std::string config_path;
  bool install_context_menu = false;
  bool uninstall_context_menu = false;
  bool verbose = false;
  app.add_option("data-file", data_path, "Orientation data file (.csv, .xlsx or .sto)");
  app.add_option("--config", config_path, "Viewer configuration (YAML)")->check(CLI::ExistingFile);
  app.add_flag("--install-context-menu", install_context_menu, "Register nodevis as an \"Open With\" handler and exit");
  app.add_flag("--uninstall-context-menu", uninstall_context_menu, "Remove the \"Open With\" handler and exit");
  app.add_flag("-v,--verbose", verbose, "Enable debug logging");

  CLI11_PARSE(app, argc, argv);

  if (verbose) {
    spdlog::set_level(spdlog::level::debug);
  }
  spdlog::info("nodevis version: {}", nodevis::common::version());

  if (install_context_menu || uninstall_context_menu) {
    try {
      const auto data_home = nodevis::shell::DefaultDataHome();
      if (install_context_menu) {
        nodevis::shell::InstallDesktopEntry(std::filesystem::canonical("/proc/self/exe"), data_home);
      } else {
        nodevis::shell::UninstallDesktopEntry(data_home);
      }
    } catch (const std::exception& ex) {
      spdlog::error("Shell integration failed: {}", ex.what());
      return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
  }

  if (data_path.empty()) {
    spdlog::error("No data file given. Usage: {} <data-file>", app.get_name());
    return EXIT_FAILURE;
  }

  nodevis::scene::ViewerConfig config;
  std::optional<nodevis::scene::Session> session;
  try {
    if (!config_path.empty()) {
      config = nodevis::scene::ViewerConfig::FromYamlFile(config_path);
    }
    session.emplace(config);
    session->Load(data_path);
  } catch (const std::exception& ex) {
    spdlog::error("Failed to load dataset: {}", ex.what());
    return EXIT_FAILURE;
  }

  if (!glfwInit()) {
    return EXIT_FAILURE;
  }

  const char* glsl_version = "#version 130";
  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

  const std::string title = fmt::format("nodevis - {}", std::filesystem::path(data_path).filename().string());
  GLFWwindow* window = glfwCreateWindow(config.window.width, config.window.height, title.c_str(), nullptr, nullptr);
  if (window == nullptr) {
    glfwTerminate();
    return EXIT_FAILURE;
  }

  glfwMakeContextCurrent(window);
  glfwSwapInterval(1);

  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGui::StyleColorsDark();
  ImGui::GetIO().FontGlobalScale = 1.3F;
  ImGui_ImplGlfw_InitForOpenGL(window, true);
  ImGui_ImplOpenGL3_Init(glsl_version);

  std::array<char, 1024> path_buffer{};
  data_path.copy(path_buffer.data(), path_buffer.size() - 1);
  std::string load_error;
  double previous_time_s = glfwGetTime();

  while (!glfwWindowShouldClose(window)) {
    glfwPollEvents();

    const double current_time_s = glfwGetTime();
    const double delta_time_s = current_time_s - previous_time_s;
    previous_time_s = current_time_s;
    session->Update(delta_time_s);

    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();

    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);
    ImGui::Begin("nodevis", nullptr,
                 ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoSavedSettings |
                     ImGuiWindowFlags_NoBringToFrontOnFocus);

    HandleKeyboard(&*session);
    const float controls_height = ImGui::GetFrameHeightWithSpacing() * 3.0F;
    ImGui::BeginChild("scene", ImVec2(0.0F, -controls_height));
    DrawScene(&*session);
    ImGui::EndChild();
    DrawControls(&*session, &path_buffer, &load_error);

    ImGui::End();

    ImGui::Render();
    int display_w = 0;
    int display_h = 0;
    glfwGetFramebufferSize(window, &display_w, &display_h);
    glViewport(0, 0, display_w, display_h);
    glClearColor(0.2f, 0.2f, 0.2f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

    glfwSwapBuffers(window);
  }

  ImGui_ImplOpenGL3_Shutdown();
  ImGui_ImplGlfw_Shutdown();
  ImGui::DestroyContext();

  glfwDestroyWindow(window);
  glfwTerminate();
  return EXIT_SUCCESS;
}
