#include "peck_targeting_pipeline.h"
#include "peck_coordinate_transform.h"
#include "peck_debug_artifacts.h"
#include "peck_image_io.h"
#include "peck_prompt_protocol.h"
#include "peck_response_parser.h"
#include "logger.h"
#include <chrono>
#include <exception>

namespace {

std::string SizeToString(int width, int height) {
  return std::to_string(width) + "x" + std::to_string(height);
}

// Clears the in-flight flag on every exit from Run, including unwinding
class RunningGuard {
 public:
  explicit RunningGuard(std::atomic<bool>& running) : running_(running) {}
  ~RunningGuard() { running_.store(false); }

  RunningGuard(const RunningGuard&) = delete;
  RunningGuard& operator=(const RunningGuard&) = delete;

 private:
  std::atomic<bool>& running_;
};

}  // namespace

PeckTargetingPipeline::PeckTargetingPipeline(IScreenCapture* capture,
                                             IVisionModel* vision,
                                             IInputInjector* input,
                                             const Options& options)
    : capture_(capture),
      vision_(vision),
      input_(input),
      options_(options),
      state_(TargetingState::IDLE),
      running_(false) {}

void PeckTargetingPipeline::Advance(TargetingState next) {
  state_.store(next);
  LOG_DEBUG("Pipeline", std::string("-> ") + TargetingStateToString(next));
}

void PeckTargetingPipeline::Fail(TargetingResult& result, TargetingStatus status,
                                 const std::string& detail) {
  result.success = false;
  result.status = status;
  result.failed_at = state_.load();
  result.state = TargetingState::FAILED;
  result.message = detail;
  result.retriable = (status == TargetingStatus::QUERY_FAILED);
  state_.store(TargetingState::FAILED);

  LOG_ERROR("Pipeline", std::string(TargetingStatusToCode(status)) + " after '" +
            TargetingStateToString(result.failed_at) + "': " + detail);
}

TargetingResult PeckTargetingPipeline::Run(const std::string& goal) {
  TargetingResult result;

  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    result = TargetingResult::Failure(TargetingStatus::INVALID_PARAMETER, TargetingState::IDLE,
                                      "run: another targeting run is in progress");
    LOG_ERROR("Pipeline", result.message);
    return result;
  }
  RunningGuard guard(running_);

  auto start_time = std::chrono::steady_clock::now();
  state_.store(TargetingState::IDLE);
  PeckDebugArtifacts debug(options_.debug_dir);

  // Stages run in a lambda so every exit path records timing and clears running_
  auto run_stages = [&]() {
    if (!capture_ || !vision_ || !input_) {
      Fail(result, TargetingStatus::INVALID_PARAMETER, "run: missing capture, vision or input backend");
      return;
    }
    if (!options_.grid.IsValid()) {
      Fail(result, TargetingStatus::INVALID_PARAMETER,
           "run: invalid cell size " + std::to_string(options_.grid.cell_size_px));
      return;
    }
    if (goal.empty()) {
      Fail(result, TargetingStatus::INVALID_PARAMETER, "run: empty goal");
      return;
    }

    LOG_INFO("Pipeline", "Targeting: '" + goal + "'");

    // Capture
    CaptureResult captured;
    try {
      captured = capture_->Capture();
    } catch (const std::exception& e) {
      Fail(result, TargetingStatus::CAPTURE_UNAVAILABLE,
           "capture: " + capture_->GetName() + " threw: " + e.what());
      return;
    } catch (...) {
      Fail(result, TargetingStatus::CAPTURE_UNAVAILABLE,
           "capture: " + capture_->GetName() + " threw a non-standard exception");
      return;
    }
    if (!captured.success) {
      Fail(result, TargetingStatus::CAPTURE_UNAVAILABLE, "capture: " + captured.error);
      return;
    }
    if (!captured.image.IsValid()) {
      Fail(result, TargetingStatus::CAPTURE_UNAVAILABLE, "capture: backend returned an empty image");
      return;
    }
    const CaptureImage& capture = captured.image;
    Advance(TargetingState::CAPTURED);
    debug.SaveCapture(capture);

    // Overlay
    result.layout = PeckGridCodec::ComputeLayout(capture.width, capture.height, options_.grid);
    GridOverlayImage overlay = codec_.RenderOverlay(capture, options_.grid);
    if (!overlay.IsValid()) {
      Fail(result, TargetingStatus::INVALID_PARAMETER, "overlay: could not render grid on " +
           SizeToString(capture.width, capture.height) + " capture");
      return;
    }
    LOG_INFO("Pipeline", "Grid " + SizeToString(result.layout.columns, result.layout.rows) +
             " over " + SizeToString(capture.width, capture.height) + " capture");
    Advance(TargetingState::OVERLAID);
    debug.SaveOverlay(overlay);

    // Query
    std::vector<uint8_t> png = PeckImageIO::EncodePNG(overlay);
    if (png.empty()) {
      Fail(result, TargetingStatus::QUERY_FAILED, "query: overlay could not be encoded as PNG");
      return;
    }
    std::string instruction = PeckPromptProtocol::BuildInstruction(
        goal, options_.grid, capture.width, capture.height);

    VisionQueryResult reply;
    try {
      reply = vision_->Query(png, instruction);
    } catch (const std::exception& e) {
      Fail(result, TargetingStatus::QUERY_FAILED,
           "query: " + vision_->GetName() + " threw: " + e.what());
      return;
    } catch (...) {
      Fail(result, TargetingStatus::QUERY_FAILED,
           "query: " + vision_->GetName() + " threw a non-standard exception");
      return;
    }
    if (!reply.success) {
      Fail(result, TargetingStatus::QUERY_FAILED, "query: " + reply.error);
      return;
    }
    result.reply = reply.content;
    LOG_DEBUG("Pipeline", "Model reply:\n" + reply.content);
    Advance(TargetingState::QUERIED);

    // Parse
    PeckResponseParser parser(capture.width, capture.height);
    PeckResponseParser::ExtractResult extracted = parser.Extract(reply.content);
    if (!extracted.found) {
      Fail(result, TargetingStatus::TARGET_NOT_FOUND,
           "parse: no coordinate label found in model reply");
      return;
    }
    result.has_label = true;
    result.label = extracted.label;

    LabelResolution origin = PeckGridCodec::ResolveLabel(extracted.label, capture.width, capture.height);
    if (!origin.ok()) {
      Fail(result, TargetingStatus::COORDINATE_OUT_OF_RANGE,
           "parse: label " + extracted.label.ToString() + " outside " +
           SizeToString(capture.width, capture.height) + " capture");
      return;
    }
    LOG_INFO("Pipeline", "Label " + extracted.label.ToString() + " (" + extracted.stage +
             ") -> origin (" + std::to_string(origin.x) + ", " + std::to_string(origin.y) + ")");
    Advance(TargetingState::PARSED);

    // Transform
    ScreenSize logical;
    try {
      logical = input_->LogicalScreenSize();
    } catch (const std::exception& e) {
      Fail(result, TargetingStatus::ACTION_FAILED,
           "transform: " + input_->GetName() + " threw: " + e.what());
      return;
    } catch (...) {
      Fail(result, TargetingStatus::ACTION_FAILED,
           "transform: " + input_->GetName() + " threw a non-standard exception");
      return;
    }
    if (!logical.IsValid()) {
      Fail(result, TargetingStatus::ACTION_FAILED,
           "transform: input backend reported no logical screen size");
      return;
    }

    ScreenSize physical;
    physical.width = capture.width;
    physical.height = capture.height;

    PeckCoordinateTransform transform(options_.grid);
    PeckCoordinateTransform::TransformResult mapped =
        transform.ToActionPoint(origin.x, origin.y, physical, logical);
    result.target = mapped.target;
    if (!mapped.success) {
      Fail(result, TargetingStatus::COORDINATE_OUT_OF_RANGE, "transform: " + mapped.error);
      return;
    }
    result.action = mapped.action;
    Advance(TargetingState::TRANSFORMED);

    if (debug.IsEnabled()) {
      std::optional<GridCell> cell = PeckGridCodec::CellAt(result.layout, origin.x, origin.y);
      if (cell) {
        debug.SaveTargetCheck(capture, *cell, mapped.target);
      }
    }

    // Act
    InputResult clicked;
    try {
      clicked = input_->MoveAndClick(mapped.action.logical_x, mapped.action.logical_y,
                                     options_.settle_delay_ms);
    } catch (const std::exception& e) {
      Fail(result, TargetingStatus::ACTION_FAILED,
           "act: " + input_->GetName() + " threw: " + e.what());
      return;
    } catch (...) {
      Fail(result, TargetingStatus::ACTION_FAILED,
           "act: " + input_->GetName() + " threw a non-standard exception");
      return;
    }
    if (!clicked.success) {
      Fail(result, TargetingStatus::ACTION_FAILED, "act: " + clicked.error);
      return;
    }

    Advance(TargetingState::ACTED);
    result.success = true;
    result.status = TargetingStatus::OK;
    result.state = TargetingState::ACTED;
    result.message = "Clicked (" + std::to_string(mapped.action.logical_x) + ", " +
                     std::to_string(mapped.action.logical_y) + ") scale " +
                     std::to_string(mapped.scale_x) + "/" + std::to_string(mapped.scale_y);
  };

  run_stages();

  auto end_time = std::chrono::steady_clock::now();
  result.elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
  LOG_INFO("Pipeline", "Finished in " + std::to_string(result.elapsed_ms / 1000.0) + "s: " +
           result.ToString());

  return result;
}
