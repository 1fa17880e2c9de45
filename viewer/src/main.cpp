#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "imgui.h"
#include "raylib.h"
#include "rlImGui.h"
#include "plangrid/core/layout_engine.hpp"

namespace {

using plangrid::core::Date;
using plangrid::core::GridConfig;
using plangrid::core::LayoutEngine;
using plangrid::core::LayoutResult;
using plangrid::core::MonthKey;
using plangrid::core::Task;
using plangrid::core::TaskBar;

constexpr int kDemoYear = 2024;
constexpr float kGridOriginX = 40.0f;
constexpr float kGridOriginY = 110.0f;
constexpr float kHeaderHeight = 22.0f;

struct ViewerUiState {
  int month_index = 0;
  std::string selected_task_id{};

  float day_width = 20.0f;
  float day_height = 60.0f;
  float row_height = 14.0f;
  int max_rows_per_day = 3;
  float month_boundary_gap = 2.0f;
  float collision_buffer = 0.5f;
  float overlap_threshold_hours = 1.0f;
  bool snap_to_grid = true;
  bool show_row_guides = true;
  bool show_residual_collisions = true;
  bool layout_dirty = true;

  float zoom = 1.5f;
  Vector2 pan{0.0f, 0.0f};

  std::string last_error;
  std::vector<std::string> logs;
  bool ui_show_workspace = true;
  float ui_workspace_width = 0.0f;
};

struct ViewerModel {
  std::vector<Task> tasks{};
  GridConfig config{};
  LayoutResult layout{};
  std::vector<MonthKey> months{};
  bool layout_ok = false;
};

struct ViewerPersistentSettings {
  int window_width = 1280;
  int window_height = 720;
  bool ui_show_workspace = true;
  float ui_workspace_width = 420.0f;
  float day_width = 20.0f;
  float row_height = 14.0f;
  int max_rows_per_day = 3;
  float month_boundary_gap = 2.0f;
  float collision_buffer = 0.5f;
  bool snap_to_grid = true;
};

constexpr const char* kViewerSettingsFile = "plangrid_viewer.ini";

bool parse_bool(std::string_view value, bool fallback) {
  if (value == "1" || value == "true" || value == "True") {
    return true;
  }
  if (value == "0" || value == "false" || value == "False") {
    return false;
  }
  return fallback;
}

ViewerPersistentSettings LoadViewerPersistentSettings() {
  ViewerPersistentSettings settings{};
  std::ifstream ifs(kViewerSettingsFile);
  if (!ifs.is_open()) {
    spdlog::info("[viewer] no {} found, using defaults", kViewerSettingsFile);
    return settings;
  }

  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty()) {
      continue;
    }
    const std::size_t eq = line.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 >= line.size()) {
      continue;
    }
    const std::string key = line.substr(0, eq);
    const std::string value = line.substr(eq + 1);
    try {
      if (key == "window_width") {
        settings.window_width = std::max(640, std::stoi(value));
      } else if (key == "window_height") {
        settings.window_height = std::max(480, std::stoi(value));
      } else if (key == "ui_show_workspace") {
        settings.ui_show_workspace = parse_bool(value, settings.ui_show_workspace);
      } else if (key == "ui_workspace_width") {
        settings.ui_workspace_width = std::clamp(std::stof(value), 300.0f, 900.0f);
      } else if (key == "day_width") {
        settings.day_width = std::clamp(std::stof(value), 4.0f, 80.0f);
      } else if (key == "row_height") {
        settings.row_height = std::clamp(std::stof(value), 4.0f, 60.0f);
      } else if (key == "max_rows_per_day") {
        settings.max_rows_per_day = std::clamp(std::stoi(value), 1, 12);
      } else if (key == "month_boundary_gap") {
        settings.month_boundary_gap = std::clamp(std::stof(value), 0.0f, 20.0f);
      } else if (key == "collision_buffer") {
        settings.collision_buffer = std::clamp(std::stof(value), 0.0f, 10.0f);
      } else if (key == "snap_to_grid") {
        settings.snap_to_grid = parse_bool(value, settings.snap_to_grid);
      }
    } catch (const std::exception& e) {
      spdlog::warn("[viewer] ignoring malformed setting '{}': {}", line, e.what());
    }
  }
  return settings;
}

void SaveViewerPersistentSettings(const ViewerPersistentSettings& settings) {
  std::ofstream ofs(kViewerSettingsFile, std::ios::trunc);
  if (!ofs.is_open()) {
    spdlog::warn("[viewer] could not write {}", kViewerSettingsFile);
    return;
  }
  ofs << "window_width=" << settings.window_width << "\n";
  ofs << "window_height=" << settings.window_height << "\n";
  ofs << "ui_show_workspace=" << (settings.ui_show_workspace ? 1 : 0) << "\n";
  ofs << "ui_workspace_width=" << settings.ui_workspace_width << "\n";
  ofs << "day_width=" << settings.day_width << "\n";
  ofs << "row_height=" << settings.row_height << "\n";
  ofs << "max_rows_per_day=" << settings.max_rows_per_day << "\n";
  ofs << "month_boundary_gap=" << settings.month_boundary_gap << "\n";
  ofs << "collision_buffer=" << settings.collision_buffer << "\n";
  ofs << "snap_to_grid=" << (settings.snap_to_grid ? 1 : 0) << "\n";
}

void PushLog(ViewerUiState& ui_state, const std::string& line) {
  ui_state.logs.push_back(line);
  if (ui_state.logs.size() > 12) {
    ui_state.logs.erase(ui_state.logs.begin());
  }
}

const char* MonthLabel(unsigned month) {
  static constexpr const char* kNames[] = {"January", "February", "March",     "April",   "May",      "June",
                                           "July",    "August",   "September", "October", "November", "December"};
  return (month >= 1 && month <= 12) ? kNames[month - 1] : "?";
}

Color ColorFromHex(const std::string& hex, float opacity) {
  if (hex.size() != 7 || hex[0] != '#') {
    return Fade(GRAY, opacity);
  }
  const unsigned long rgb = std::strtoul(hex.c_str() + 1, nullptr, 16);
  Color color{};
  color.r = static_cast<unsigned char>((rgb >> 16) & 0xFF);
  color.g = static_cast<unsigned char>((rgb >> 8) & 0xFF);
  color.b = static_cast<unsigned char>(rgb & 0xFF);
  color.a = 255;
  return Fade(color, opacity);
}

std::vector<MonthKey> MonthsInRange(Date start, Date end) {
  std::vector<MonthKey> months;
  Date cursor = plangrid::core::first_day_of_month(start);
  while (cursor <= end) {
    months.push_back(plangrid::core::month_key(cursor));
    cursor = plangrid::core::add_days(plangrid::core::last_day_of_month(cursor), 1);
  }
  return months;
}

GridConfig BuildConfig(const ViewerUiState& ui_state) {
  GridConfig config =
      plangrid::core::make_default_grid_config(Date::FromYmd(kDemoYear, 1, 1), Date::FromYmd(kDemoYear, 2, 29));
  config.current_date = Date::FromYmd(kDemoYear, 1, 10);
  config.day_width = ui_state.day_width;
  config.day_height = ui_state.day_height;
  config.row_height = ui_state.row_height;
  config.max_rows_per_day = ui_state.max_rows_per_day;
  config.month_boundary_gap = ui_state.month_boundary_gap;
  config.collision_buffer = ui_state.collision_buffer;
  config.overlap_threshold_hours = ui_state.overlap_threshold_hours;
  config.snap_to_grid = ui_state.snap_to_grid;
  return config;
}

void RunLayout(const LayoutEngine& engine, ViewerModel& model, ViewerUiState& ui_state) {
  model.config = BuildConfig(ui_state);
  auto result = engine.Run(model.tasks, model.config);
  ui_state.layout_dirty = false;
  if (!result.ok) {
    model.layout_ok = false;
    ui_state.last_error = result.error;
    PushLog(ui_state, "[error] " + result.error);
    return;
  }
  model.layout = std::move(result.value);
  model.layout_ok = true;
  model.months = MonthsInRange(model.config.calendar_start, model.config.calendar_end);
  ui_state.month_index = std::clamp(ui_state.month_index, 0, static_cast<int>(model.months.size()) - 1);
  ui_state.last_error.clear();
  PushLog(ui_state, "[layout] bars=" + std::to_string(model.layout.bars.size()) +
                        " overlaps=" + std::to_string(model.layout.overlaps.total_overlaps) +
                        " resolved=" + std::to_string(model.layout.statistics.resolved_conflicts));
}

Date VisibleMonthStart(const ViewerModel& model, const ViewerUiState& ui_state) {
  const MonthKey& key = model.months[static_cast<std::size_t>(ui_state.month_index)];
  return Date::FromYmd(key.year, key.month, 1);
}

// Grid units -> screen pixels for the visible month.
Rectangle BarToScreen(const ViewerModel& model, const ViewerUiState& ui_state, const TaskBar& bar) {
  const double month_x =
      static_cast<double>(plangrid::core::days_between(model.config.calendar_start, VisibleMonthStart(model, ui_state))) *
      model.config.day_width;
  Rectangle rect{};
  rect.x = kGridOriginX + ui_state.pan.x + static_cast<float>((bar.bounds.x - month_x) * ui_state.zoom);
  rect.y = kGridOriginY + kHeaderHeight + ui_state.pan.y + static_cast<float>(bar.bounds.y * ui_state.zoom);
  rect.width = static_cast<float>(bar.bounds.width * ui_state.zoom);
  rect.height = static_cast<float>(bar.bounds.height * ui_state.zoom);
  return rect;
}

void UpdateViewportInput(ViewerUiState& ui_state) {
  if (ImGui::GetIO().WantCaptureMouse) {
    return;
  }
  const float wheel = GetMouseWheelMove();
  if (wheel != 0.0f) {
    ui_state.zoom = std::clamp(ui_state.zoom * (wheel > 0.0f ? 1.1f : 1.0f / 1.1f), 0.4f, 6.0f);
  }
  if (IsMouseButtonDown(MOUSE_BUTTON_MIDDLE)) {
    const Vector2 delta = GetMouseDelta();
    ui_state.pan.x += delta.x;
    ui_state.pan.y += delta.y;
  }
}

void PickBar(const ViewerModel& model, ViewerUiState& ui_state) {
  if (ImGui::GetIO().WantCaptureMouse || !IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
    return;
  }
  const MonthKey& key = model.months[static_cast<std::size_t>(ui_state.month_index)];
  const Vector2 mouse = GetMousePosition();
  // Last drawn bar is on top.
  const auto bars = model.layout.BarsForMonth(key.year, key.month);
  for (auto it = bars.rbegin(); it != bars.rend(); ++it) {
    if (CheckCollisionPointRec(mouse, BarToScreen(model, ui_state, **it))) {
      ui_state.selected_task_id = (*it)->task_id;
      PushLog(ui_state, "[select] " + ui_state.selected_task_id);
      return;
    }
  }
  ui_state.selected_task_id.clear();
}

void DrawMonthGrid(const ViewerModel& model, const ViewerUiState& ui_state) {
  const Date month_start = VisibleMonthStart(model, ui_state);
  const Date month_end = plangrid::core::last_day_of_month(month_start);
  const int days = plangrid::core::days_between(month_start, month_end) + 1;
  const float day_w = static_cast<float>(model.config.day_width * ui_state.zoom);
  const float rows_h = static_cast<float>(model.config.row_height * model.config.max_rows_per_day * ui_state.zoom);
  const float body_h = std::max(rows_h, static_cast<float>(model.config.day_height * ui_state.zoom));
  const float left = kGridOriginX + ui_state.pan.x;
  const float top = kGridOriginY + ui_state.pan.y;

  for (int day = 0; day < days; ++day) {
    const float x = left + static_cast<float>(day) * day_w;
    const Date date = plangrid::core::add_days(month_start, day);
    const bool is_today = date == model.config.current_date;
    DrawRectangle(static_cast<int>(x), static_cast<int>(top), static_cast<int>(day_w), static_cast<int>(kHeaderHeight),
                  is_today ? Color{70, 90, 120, 255} : Color{40, 48, 58, 255});
    DrawText(std::to_string(date.day()).c_str(), static_cast<int>(x + 3.0f), static_cast<int>(top + 5.0f), 10,
             RAYWHITE);
    DrawRectangleLines(static_cast<int>(x), static_cast<int>(top + kHeaderHeight), static_cast<int>(day_w),
                       static_cast<int>(body_h), Color{60, 70, 82, 255});
  }

  if (ui_state.show_row_guides) {
    const float row_h = static_cast<float>(model.config.row_height * ui_state.zoom);
    for (int row = 1; row <= model.config.max_rows_per_day; ++row) {
      const float y = top + kHeaderHeight + static_cast<float>(row) * row_h;
      DrawLineEx({left, y}, {left + day_w * static_cast<float>(days), y}, 1.0f, Color{90, 90, 60, 160});
    }
  }
}

void DrawBars(const ViewerModel& model, const ViewerUiState& ui_state) {
  const MonthKey& key = model.months[static_cast<std::size_t>(ui_state.month_index)];
  auto bars = model.layout.BarsForMonth(key.year, key.month);
  std::stable_sort(bars.begin(), bars.end(), [](const TaskBar* a, const TaskBar* b) { return a->z_order < b->z_order; });

  for (const TaskBar* bar : bars) {
    const Rectangle rect = BarToScreen(model, ui_state, *bar);
    DrawRectangleRec(rect, ColorFromHex(bar->color, static_cast<float>(bar->opacity)));
    const bool selected = bar->task_id == ui_state.selected_task_id;
    DrawRectangleLinesEx(rect, selected ? 2.5f : static_cast<float>(bar->border_width),
                         selected ? YELLOW : Color{20, 20, 20, 200});
    if (bar->is_continuation) {
      DrawTriangle({rect.x, rect.y + rect.height * 0.5f}, {rect.x + 5.0f, rect.y + rect.height},
                   {rect.x + 5.0f, rect.y}, RAYWHITE);
    }
    if (!bar->is_end) {
      const float right = rect.x + rect.width;
      DrawTriangle({right - 5.0f, rect.y}, {right - 5.0f, rect.y + rect.height},
                   {right, rect.y + rect.height * 0.5f}, RAYWHITE);
    }
    if (rect.width > 40.0f && rect.height > 9.0f) {
      DrawText(bar->task_name.c_str(), static_cast<int>(rect.x + 7.0f), static_cast<int>(rect.y + 1.0f), 10, BLACK);
    }
  }

  if (!ui_state.show_residual_collisions) {
    return;
  }
  for (const auto& residual : model.layout.residual_collisions) {
    for (const TaskBar* bar : bars) {
      if (bar->task_id == residual.task_a_id || bar->task_id == residual.task_b_id) {
        DrawRectangleLinesEx(BarToScreen(model, ui_state, *bar), 1.5f, RED);
      }
    }
  }
}

void DrawTopbarWindow(const ViewerModel& model, ViewerUiState& ui_state) {
  ImGui::SetNextWindowPos(ImVec2(8.0f, 8.0f), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(std::max(420.0f, static_cast<float>(GetScreenWidth()) - 16.0f), 66.0f),
                           ImGuiCond_Always);
  const ImGuiWindowFlags flags = ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove;
  if (!ImGui::Begin("Topbar", nullptr, flags)) {
    ImGui::End();
    return;
  }
  if (ImGui::Button("<") && ui_state.month_index > 0) {
    --ui_state.month_index;
  }
  ImGui::SameLine();
  if (!model.months.empty()) {
    const MonthKey& key = model.months[static_cast<std::size_t>(ui_state.month_index)];
    ImGui::Text("%s %d", MonthLabel(key.month), key.year);
  }
  ImGui::SameLine();
  if (ImGui::Button(">") && ui_state.month_index + 1 < static_cast<int>(model.months.size())) {
    ++ui_state.month_index;
  }
  ImGui::SameLine();
  if (ImGui::Button("Re-run Layout")) {
    ui_state.layout_dirty = true;
  }
  ImGui::SameLine();
  ImGui::Checkbox("Workspace", &ui_state.ui_show_workspace);
  ImGui::SameLine();
  if (ImGui::Button("Reset View")) {
    ui_state.pan = {0.0f, 0.0f};
    ui_state.zoom = 1.5f;
  }
  if (!ui_state.last_error.empty()) {
    ImGui::TextColored(ImVec4(1.0f, 0.4f, 0.4f, 1.0f), "%s", ui_state.last_error.c_str());
  } else {
    ImGui::TextDisabled("LMB select bar, MMB pan, wheel zoom");
  }
  ImGui::End();
}

void DrawTasksContent(const ViewerModel& model, ViewerUiState& ui_state) {
  if (ImGui::BeginTable("TaskTable", 5, ImGuiTableFlags_RowBg | ImGuiTableFlags_Borders | ImGuiTableFlags_ScrollY)) {
    ImGui::TableSetupColumn("Task");
    ImGui::TableSetupColumn("Dates");
    ImGui::TableSetupColumn("Row");
    ImGui::TableSetupColumn("Band");
    ImGui::TableSetupColumn("Prominence");
    ImGui::TableHeadersRow();
    for (const Task& task : model.tasks) {
      const auto bars = model.layout.BarsForTask(task.id);
      ImGui::TableNextRow();
      ImGui::TableSetColumnIndex(0);
      if (ImGui::Selectable(task.id.c_str(), task.id == ui_state.selected_task_id,
                            ImGuiSelectableFlags_SpanAllColumns)) {
        ui_state.selected_task_id = task.id;
      }
      ImGui::TableSetColumnIndex(1);
      ImGui::Text("%s..%s", plangrid::core::format_iso_date(task.start).c_str(),
                  plangrid::core::format_iso_date(task.end).c_str());
      if (bars.empty()) {
        ImGui::TableSetColumnIndex(2);
        ImGui::TextDisabled("skipped");
        continue;
      }
      ImGui::TableSetColumnIndex(2);
      ImGui::Text("%d", bars.front()->row);
      ImGui::TableSetColumnIndex(3);
      ImGui::TextUnformatted(plangrid::core::UrgencyBandLabel(bars.front()->band));
      ImGui::TableSetColumnIndex(4);
      ImGui::Text("%.3f", bars.front()->prominence);
    }
    ImGui::EndTable();
  }

  if (ui_state.selected_task_id.empty()) {
    return;
  }
  ImGui::Separator();
  ImGui::Text("Selected: %s", ui_state.selected_task_id.c_str());
  for (const Task& task : model.tasks) {
    if (task.id != ui_state.selected_task_id) {
      continue;
    }
    ImGui::TextDisabled("%s | %s | assignee: %s", task.category.c_str(), task.status.c_str(),
                        task.assignee.empty() ? "-" : task.assignee.c_str());
    if (!task.description.empty()) {
      ImGui::TextWrapped("%s", task.description.c_str());
    }
    for (const std::string& dependency : task.dependencies) {
      ImGui::BulletText("waits on %s", dependency.c_str());
    }
  }
  for (const TaskBar* bar : model.layout.BarsForTask(ui_state.selected_task_id)) {
    ImGui::BulletText("seg %d/%d %s x=%.1f y=%.1f w=%.1f h=%.1f %s%s%s", bar->segment_index + 1, bar->segment_count,
                      plangrid::core::format_month_key(bar->month).c_str(), bar->bounds.x, bar->bounds.y,
                      bar->bounds.width, bar->bounds.height, bar->is_start ? "[start]" : "",
                      bar->is_continuation ? "[cont]" : "", bar->is_end ? "[end]" : "");
  }
}

void DrawOverlapsContent(const ViewerModel& model) {
  const auto& overlaps = model.layout.overlaps;
  ImGui::TextWrapped("%s", overlaps.summary.c_str());
  for (std::size_t i = 0; i < overlaps.category_counts.size(); ++i) {
    if (overlaps.category_counts[i] == 0) {
      continue;
    }
    const auto category = static_cast<plangrid::core::OverlapCategory>(i);
    ImGui::BulletText("%s: %d", plangrid::core::OverlapCategoryLabel(category),
                      static_cast<int>(overlaps.category_counts[i]));
  }
  ImGui::Separator();
  for (const auto& group : overlaps.groups) {
    if (group.overlaps.empty()) {
      continue;
    }
    const std::string header = "Group " + std::to_string(group.group_index) + " [" +
                               plangrid::core::OverlapSeverityLabel(group.max_severity) + "]";
    if (ImGui::CollapsingHeader(header.c_str())) {
      ImGui::TextWrapped("%s", group.resolution.c_str());
      for (const auto& overlap : group.overlaps) {
        ImGui::BulletText("%s / %s / %s", plangrid::core::OverlapTypeLabel(overlap.type),
                          plangrid::core::OverlapSeverityLabel(overlap.severity),
                          plangrid::core::OverlapCategoryLabel(overlap.category));
        ImGui::Indent();
        ImGui::TextWrapped("%s", overlap.reason.c_str());
        ImGui::TextWrapped("%s", overlap.cause.c_str());
        ImGui::TextDisabled("%s", overlap.hint.c_str());
        ImGui::Unindent();
      }
    }
  }
}

void DrawStatisticsContent(const ViewerModel& model, ViewerUiState& ui_state) {
  const auto& stats = model.layout.statistics;
  ImGui::Text("Tasks %d  Bars %d  Groups %d", static_cast<int>(stats.task_count), static_cast<int>(stats.bar_count),
              static_cast<int>(stats.group_count));
  ImGui::Text("Bar height avg %.2f max %.2f", stats.average_bar_height, stats.max_bar_height);
  ImGui::Text("Bar width avg %.2f max %.2f", stats.average_bar_width, stats.max_bar_width);
  ImGui::Text("Stack height avg %.2f max %.2f", stats.average_stack_height, stats.max_stack_height);
  ImGui::Text("Resolved %d  Spacing %d  Overflow %d  Residual %d", static_cast<int>(stats.resolved_conflicts),
              static_cast<int>(stats.spacing_adjustments), static_cast<int>(stats.overflow_task_count),
              static_cast<int>(stats.residual_collision_count));
  ImGui::Text("Month segments %d", static_cast<int>(stats.month_boundary_count));
  ImGui::Separator();
  ImGui::ProgressBar(static_cast<float>(std::min(1.0, stats.space_efficiency)), ImVec2(-1.0f, 0.0f), "space efficiency");
  ImGui::ProgressBar(static_cast<float>(stats.alignment_score), ImVec2(-1.0f, 0.0f), "alignment");
  ImGui::ProgressBar(static_cast<float>(stats.visual_balance), ImVec2(-1.0f, 0.0f), "visual balance");
  ImGui::ProgressBar(static_cast<float>(stats.grid_utilization), ImVec2(-1.0f, 0.0f), "grid utilization");

  if (ImGui::CollapsingHeader("Recommendations", ImGuiTreeNodeFlags_DefaultOpen)) {
    if (model.layout.recommendations.empty()) {
      ImGui::TextDisabled("none");
    }
    for (const std::string& line : model.layout.recommendations) {
      ImGui::BulletText("%s", line.c_str());
    }
  }
  if (ImGui::CollapsingHeader("Log")) {
    for (const std::string& line : ui_state.logs) {
      ImGui::TextUnformatted(line.c_str());
    }
  }
}

void DrawGridContent(ViewerUiState& ui_state) {
  bool changed = false;
  changed |= ImGui::SliderFloat("Day Width", &ui_state.day_width, 4.0f, 80.0f, "%.0f");
  changed |= ImGui::SliderFloat("Day Height", &ui_state.day_height, 10.0f, 200.0f, "%.0f");
  changed |= ImGui::SliderFloat("Row Height", &ui_state.row_height, 4.0f, 60.0f, "%.1f");
  changed |= ImGui::SliderInt("Max Rows/Day", &ui_state.max_rows_per_day, 1, 12);
  changed |= ImGui::SliderFloat("Month Gap", &ui_state.month_boundary_gap, 0.0f, 20.0f, "%.1f");
  changed |= ImGui::SliderFloat("Collision Buffer", &ui_state.collision_buffer, 0.0f, 10.0f, "%.2f");
  changed |= ImGui::SliderFloat("Overlap Threshold (h)", &ui_state.overlap_threshold_hours, 0.0f, 48.0f, "%.1f");
  changed |= ImGui::Checkbox("Snap To Grid", &ui_state.snap_to_grid);
  ImGui::Separator();
  ImGui::Checkbox("Row Guides", &ui_state.show_row_guides);
  ImGui::Checkbox("Highlight Residual Collisions", &ui_state.show_residual_collisions);
  if (changed) {
    ui_state.layout_dirty = true;
  }
}

void DrawWorkspaceWindow(const ViewerModel& model, ViewerUiState& ui_state) {
  if (!ui_state.ui_show_workspace) {
    return;
  }
  const float screen_w = static_cast<float>(GetScreenWidth());
  const float screen_h = static_cast<float>(GetScreenHeight());
  const float margin = 8.0f;
  const float min_w = 300.0f;
  const float max_w = std::max(min_w, screen_w - margin * 2.0f);
  if (ui_state.ui_workspace_width <= 1.0f) {
    ui_state.ui_workspace_width = std::clamp(screen_w * 0.36f, min_w, std::min(760.0f, max_w));
  }
  ui_state.ui_workspace_width = std::clamp(ui_state.ui_workspace_width, min_w, std::min(760.0f, max_w));
  const float workspace_w = ui_state.ui_workspace_width;
  const float x = std::max(margin, screen_w - workspace_w - margin);
  const float y = 82.0f;
  const float h = std::max(240.0f, screen_h - y - margin);

  ImGui::SetNextWindowPos(ImVec2(x, y), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(workspace_w, h), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSizeConstraints(ImVec2(min_w, 240.0f), ImVec2(std::min(760.0f, max_w), h));
  const ImGuiWindowFlags flags = ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoMove;
  if (!ImGui::Begin("Workspace", nullptr, flags)) {
    ImGui::End();
    return;
  }
  ui_state.ui_workspace_width = ImGui::GetWindowSize().x;
  if (ImGui::BeginTabBar("WorkspaceTabs")) {
    if (ImGui::BeginTabItem("Tasks")) {
      DrawTasksContent(model, ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Overlaps")) {
      DrawOverlapsContent(model);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Statistics")) {
      DrawStatisticsContent(model, ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Grid")) {
      DrawGridContent(ui_state);
      ImGui::EndTabItem();
    }
    ImGui::EndTabBar();
  }
  ImGui::End();
}

} // namespace

int main() {
  const ViewerPersistentSettings persisted = LoadViewerPersistentSettings();
  SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT | FLAG_VSYNC_HINT);
  InitWindow(persisted.window_width, persisted.window_height, "plangrid layout inspector");
  SetExitKey(KEY_NULL);
  SetTargetFPS(60);

  const LayoutEngine engine;
  ViewerModel model;
  model.tasks = plangrid::core::make_demo_tasks(kDemoYear);

  ViewerUiState ui_state;
  ui_state.ui_show_workspace = persisted.ui_show_workspace;
  ui_state.ui_workspace_width = persisted.ui_workspace_width;
  ui_state.day_width = persisted.day_width;
  ui_state.row_height = persisted.row_height;
  ui_state.max_rows_per_day = persisted.max_rows_per_day;
  ui_state.month_boundary_gap = persisted.month_boundary_gap;
  ui_state.collision_buffer = persisted.collision_buffer;
  ui_state.snap_to_grid = persisted.snap_to_grid;
  PushLog(ui_state, "[info] inspector started");
  PushLog(ui_state, "[info] demo tasks loaded: " + std::to_string(model.tasks.size()));
  spdlog::info("[viewer] started with {} demo tasks", model.tasks.size());

  rlImGuiSetup(true);
  ImGui::StyleColorsDark();
  {
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 3.0f;
    style.FrameRounding = 2.0f;
    style.GrabRounding = 2.0f;
    style.WindowBorderSize = 1.0f;
    style.FrameBorderSize = 0.0f;
  }
  while (!WindowShouldClose()) {
    if (ui_state.layout_dirty) {
      RunLayout(engine, model, ui_state);
    }

    BeginDrawing();
    ClearBackground(Color{26, 32, 39, 255});

    rlImGuiBegin();
    UpdateViewportInput(ui_state);
    if (model.layout_ok && !model.months.empty()) {
      PickBar(model, ui_state);
      DrawMonthGrid(model, ui_state);
      DrawBars(model, ui_state);
    }

    DrawTopbarWindow(model, ui_state);
    if (model.layout_ok) {
      DrawWorkspaceWindow(model, ui_state);
    }
    rlImGuiEnd();

    DrawFPS(10, GetScreenHeight() - 24);
    EndDrawing();
  }

  rlImGuiShutdown();
  {
    ViewerPersistentSettings out{};
    out.window_width = GetScreenWidth();
    out.window_height = GetScreenHeight();
    out.ui_show_workspace = ui_state.ui_show_workspace;
    out.ui_workspace_width = ui_state.ui_workspace_width;
    out.day_width = ui_state.day_width;
    out.row_height = ui_state.row_height;
    out.max_rows_per_day = ui_state.max_rows_per_day;
    out.month_boundary_gap = ui_state.month_boundary_gap;
    out.collision_buffer = ui_state.collision_buffer;
    out.snap_to_grid = ui_state.snap_to_grid;
    SaveViewerPersistentSettings(out);
  }
  CloseWindow();
  return 0;
}
