#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>
#include <string>
#include "peck_targeting_pipeline.h"
#include "peck_test_fakes.h"

namespace {

const char kSaveButtonReply[] =
    "```json\n{\"hex_coord\": \"0280,0140\", \"reasoning\": \"Save icon in the toolbar\"}\n```";

PeckTargetingPipeline::Options DefaultOptions() {
  PeckTargetingPipeline::Options options;
  options.grid.cell_size_px = 40;
  options.settle_delay_ms = 0;
  return options;
}

// Starts a second run on the same pipeline from inside Capture()
class ReentrantScreenCapture : public IScreenCapture {
 public:
  explicit ReentrantScreenCapture(const CaptureImage& image) : image_(image) {}

  std::string GetName() const override { return "reentrant-capture"; }

  CaptureResult Capture() override {
    if (pipeline && !nested_ran) {
      nested_ran = true;
      nested = pipeline->Run("nested goal");
    }
    CaptureResult result;
    result.success = true;
    result.image = image_;
    return result;
  }

  PeckTargetingPipeline* pipeline = nullptr;
  bool nested_ran = false;
  TargetingResult nested;

 private:
  CaptureImage image_;
};

bool FileExists(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && st.st_size > 0;
}

class TargetingPipelineTest : public ::testing::Test {
 protected:
  TargetingPipelineTest()
      : capture_(RasterImage::Create(1920, 1080)),
        vision_(kSaveButtonReply),
        input_(MakeSize(1920, 1080)) {}

  TargetingResult RunWith(const PeckTargetingPipeline::Options& options,
                          const std::string& goal = "Click the Save button") {
    PeckTargetingPipeline pipeline(&capture_, &vision_, &input_, options);
    return pipeline.Run(goal);
  }

  TargetingResult Run(const std::string& goal = "Click the Save button") {
    return RunWith(DefaultOptions(), goal);
  }

  FakeScreenCapture capture_;
  FakeVisionModel vision_;
  FakeInputInjector input_;
};

}  // namespace

TEST_F(TargetingPipelineTest, EndToEndClicksCellCenter) {
  TargetingResult result = Run();

  ASSERT_TRUE(result.success) << result.ToString();
  EXPECT_EQ(result.status, TargetingStatus::OK);
  EXPECT_EQ(result.state, TargetingState::ACTED);
  EXPECT_EQ(result.layout.columns, 48);
  EXPECT_EQ(result.layout.rows, 27);
  ASSERT_TRUE(result.has_label);
  EXPECT_EQ(result.label.x, 640);
  EXPECT_EQ(result.label.y, 320);
  EXPECT_EQ(result.target.physical_x, 660);
  EXPECT_EQ(result.target.physical_y, 340);
  EXPECT_EQ(result.action.logical_x, 660);
  EXPECT_EQ(result.action.logical_y, 340);

  ASSERT_EQ(input_.clicks.size(), 1u);
  EXPECT_EQ(input_.clicks[0].logical_x, 660);
  EXPECT_EQ(input_.clicks[0].logical_y, 340);
  EXPECT_GE(result.elapsed_ms, 0.0);
}

TEST_F(TargetingPipelineTest, SendsOverlayPngAndInstruction) {
  Run("Click the Save button");

  ASSERT_EQ(vision_.calls, 1);
  ASSERT_GE(vision_.last_png.size(), 8u);
  EXPECT_EQ(vision_.last_png[0], 0x89);
  EXPECT_EQ(vision_.last_png[1], 'P');
  EXPECT_EQ(vision_.last_png[2], 'N');
  EXPECT_EQ(vision_.last_png[3], 'G');
  EXPECT_NE(vision_.last_instruction.find("Click the Save button"), std::string::npos);
  EXPECT_NE(vision_.last_instruction.find("48 columns x 27 rows"), std::string::npos);
}

TEST_F(TargetingPipelineTest, PassesSettleDelayToInjector) {
  PeckTargetingPipeline::Options options = DefaultOptions();
  options.settle_delay_ms = 250;
  TargetingResult result = RunWith(options);
  ASSERT_TRUE(result.success) << result.ToString();
  EXPECT_EQ(input_.last_settle_delay_ms, 250);
}

TEST(TargetingPipelineScaling, HighDpiCaptureMapsToLogicalPixels) {
  FakeScreenCapture capture(RasterImage::Create(2560, 1440));
  FakeVisionModel vision("{\"hex_coord\": \"0280,01E0\", \"reasoning\": \"icon\"}");
  FakeInputInjector input(MakeSize(1280, 720));

  PeckTargetingPipeline::Options options;
  options.settle_delay_ms = 0;
  PeckTargetingPipeline pipeline(&capture, &vision, &input, options);
  TargetingResult result = pipeline.Run("Click the icon");

  ASSERT_TRUE(result.success) << result.ToString();
  EXPECT_EQ(result.target.physical_x, 660);
  EXPECT_EQ(result.target.physical_y, 500);
  ASSERT_EQ(input.clicks.size(), 1u);
  EXPECT_EQ(input.clicks[0].logical_x, 330);
  EXPECT_EQ(input.clicks[0].logical_y, 250);
}

TEST_F(TargetingPipelineTest, CaptureErrorIsCaptureUnavailable) {
  capture_.error = "Cannot open X display";
  TargetingResult result = Run();

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.status, TargetingStatus::CAPTURE_UNAVAILABLE);
  EXPECT_EQ(result.state, TargetingState::FAILED);
  EXPECT_EQ(result.failed_at, TargetingState::IDLE);
  EXPECT_NE(result.message.find("Cannot open X display"), std::string::npos);
  EXPECT_FALSE(result.retriable);
  EXPECT_EQ(vision_.calls, 0);
  EXPECT_TRUE(input_.clicks.empty());
}

TEST_F(TargetingPipelineTest, CaptureExceptionIsCaptureUnavailable) {
  capture_.throw_message = "display went away";
  TargetingResult result = Run();

  EXPECT_EQ(result.status, TargetingStatus::CAPTURE_UNAVAILABLE);
  EXPECT_NE(result.message.find("display went away"), std::string::npos);
}

TEST_F(TargetingPipelineTest, NonStandardCaptureExceptionIsClassified) {
  capture_.throw_non_standard = true;
  TargetingResult result = Run();

  EXPECT_EQ(result.status, TargetingStatus::CAPTURE_UNAVAILABLE);
  EXPECT_EQ(result.failed_at, TargetingState::IDLE);
  EXPECT_NE(result.message.find("non-standard exception"), std::string::npos);
}

TEST_F(TargetingPipelineTest, RunSucceedsAfterNonStandardException) {
  PeckTargetingPipeline pipeline(&capture_, &vision_, &input_, DefaultOptions());

  capture_.throw_non_standard = true;
  EXPECT_EQ(pipeline.Run("Click the Save button").status, TargetingStatus::CAPTURE_UNAVAILABLE);

  capture_.throw_non_standard = false;
  TargetingResult result = pipeline.Run("Click the Save button");
  ASSERT_TRUE(result.success) << result.ToString();
  EXPECT_EQ(result.status, TargetingStatus::OK);
  ASSERT_EQ(input_.clicks.size(), 1u);
}

TEST(TargetingPipelineConcurrency, OverlappingRunIsRejected) {
  ReentrantScreenCapture capture(RasterImage::Create(1920, 1080));
  FakeVisionModel vision(kSaveButtonReply);
  FakeInputInjector input(MakeSize(1920, 1080));

  PeckTargetingPipeline pipeline(&capture, &vision, &input, DefaultOptions());
  capture.pipeline = &pipeline;

  TargetingResult outer = pipeline.Run("Click the Save button");

  ASSERT_TRUE(capture.nested_ran);
  EXPECT_EQ(capture.nested.status, TargetingStatus::INVALID_PARAMETER);
  EXPECT_NE(capture.nested.message.find("in progress"), std::string::npos);

  ASSERT_TRUE(outer.success) << outer.ToString();
  EXPECT_EQ(outer.state, TargetingState::ACTED);
  ASSERT_EQ(input.clicks.size(), 1u);
  EXPECT_EQ(vision.calls, 1);

  // The flag is cleared once the outer run returns
  EXPECT_TRUE(pipeline.Run("Click the Save button").success);
}

TEST_F(TargetingPipelineTest, QueryErrorIsRetriable) {
  vision_.error = "HTTP error 503";
  TargetingResult result = Run();

  EXPECT_EQ(result.status, TargetingStatus::QUERY_FAILED);
  EXPECT_EQ(result.failed_at, TargetingState::OVERLAID);
  EXPECT_TRUE(result.retriable);
  EXPECT_NE(result.message.find("HTTP error 503"), std::string::npos);
  EXPECT_TRUE(input_.clicks.empty());
}

TEST_F(TargetingPipelineTest, QueryExceptionIsQueryFailed) {
  vision_.throw_message = "connection reset";
  TargetingResult result = Run();

  EXPECT_EQ(result.status, TargetingStatus::QUERY_FAILED);
  EXPECT_TRUE(result.retriable);
}

TEST(TargetingPipelineFailures, NullCoordinateIsTargetNotFound) {
  FakeScreenCapture capture(RasterImage::Create(640, 480));
  FakeVisionModel vision("{\"hex_coord\": null, \"reasoning\": \"no save button visible\"}");
  FakeInputInjector input(MakeSize(640, 480));

  PeckTargetingPipeline pipeline(&capture, &vision, &input, PeckTargetingPipeline::Options());
  TargetingResult result = pipeline.Run("Click Save");

  EXPECT_EQ(result.status, TargetingStatus::TARGET_NOT_FOUND);
  EXPECT_EQ(result.failed_at, TargetingState::QUERIED);
  EXPECT_FALSE(result.retriable);
  EXPECT_FALSE(result.has_label);
  EXPECT_NE(result.message.find("no coordinate label found"), std::string::npos);
  EXPECT_EQ(result.reply, "{\"hex_coord\": null, \"reasoning\": \"no save button visible\"}");
  EXPECT_TRUE(input.clicks.empty());
}

TEST(TargetingPipelineFailures, UnparseableReplyIsTargetNotFound) {
  FakeScreenCapture capture(RasterImage::Create(640, 480));
  FakeVisionModel vision("I am not able to see any buttons.");
  FakeInputInjector input(MakeSize(640, 480));

  PeckTargetingPipeline pipeline(&capture, &vision, &input, PeckTargetingPipeline::Options());
  EXPECT_EQ(pipeline.Run("Click Save").status, TargetingStatus::TARGET_NOT_FOUND);
}

TEST(TargetingPipelineFailures, LabelOutsideCaptureIsOutOfRange) {
  FakeScreenCapture capture(RasterImage::Create(640, 480));
  FakeVisionModel vision("{\"hex_coord\": \"0800,0100\", \"reasoning\": \"right edge\"}");
  FakeInputInjector input(MakeSize(640, 480));

  PeckTargetingPipeline pipeline(&capture, &vision, &input, PeckTargetingPipeline::Options());
  TargetingResult result = pipeline.Run("Click Save");

  EXPECT_EQ(result.status, TargetingStatus::COORDINATE_OUT_OF_RANGE);
  EXPECT_EQ(result.failed_at, TargetingState::QUERIED);
  ASSERT_TRUE(result.has_label);
  EXPECT_EQ(result.label.x, 0x800);
  EXPECT_TRUE(input.clicks.empty());
}

TEST_F(TargetingPipelineTest, InjectorErrorIsActionFailed) {
  input_.error = "XSendEvent failed";
  TargetingResult result = Run();

  EXPECT_EQ(result.status, TargetingStatus::ACTION_FAILED);
  EXPECT_EQ(result.failed_at, TargetingState::TRANSFORMED);
  EXPECT_NE(result.message.find("XSendEvent failed"), std::string::npos);
  EXPECT_FALSE(result.retriable);
}

TEST_F(TargetingPipelineTest, InjectorExceptionIsActionFailed) {
  input_.throw_message = "no pointer device";
  EXPECT_EQ(Run().status, TargetingStatus::ACTION_FAILED);
}

TEST(TargetingPipelineFailures, MissingLogicalScreenIsActionFailed) {
  FakeScreenCapture capture(RasterImage::Create(640, 480));
  FakeVisionModel vision("{\"hex_coord\": \"0000,0000\"}");
  FakeInputInjector input(MakeSize(0, 0));

  PeckTargetingPipeline pipeline(&capture, &vision, &input, PeckTargetingPipeline::Options());
  TargetingResult result = pipeline.Run("Click");

  EXPECT_EQ(result.status, TargetingStatus::ACTION_FAILED);
  EXPECT_EQ(result.failed_at, TargetingState::PARSED);
}

TEST_F(TargetingPipelineTest, EmptyGoalIsInvalidParameter) {
  TargetingResult result = Run("");
  EXPECT_EQ(result.status, TargetingStatus::INVALID_PARAMETER);
  EXPECT_EQ(capture_.calls, 0);
}

TEST_F(TargetingPipelineTest, InvalidCellSizeIsInvalidParameter) {
  PeckTargetingPipeline::Options options = DefaultOptions();
  options.grid.cell_size_px = 0;
  TargetingResult result = RunWith(options);
  EXPECT_EQ(result.status, TargetingStatus::INVALID_PARAMETER);
  EXPECT_EQ(capture_.calls, 0);
}

TEST(TargetingPipelineFailures, MissingCollaboratorIsInvalidParameter) {
  FakeScreenCapture capture(RasterImage::Create(640, 480));
  FakeInputInjector input(MakeSize(640, 480));
  PeckTargetingPipeline pipeline(&capture, nullptr, &input, PeckTargetingPipeline::Options());
  EXPECT_EQ(pipeline.Run("Click").status, TargetingStatus::INVALID_PARAMETER);
}

TEST_F(TargetingPipelineTest, StateReflectsLastRun) {
  PeckTargetingPipeline pipeline(&capture_, &vision_, &input_, DefaultOptions());
  EXPECT_EQ(pipeline.GetState(), TargetingState::IDLE);
  pipeline.Run("Click the Save button");
  EXPECT_EQ(pipeline.GetState(), TargetingState::ACTED);

  vision_.error = "timeout";
  pipeline.Run("Click the Save button");
  EXPECT_EQ(pipeline.GetState(), TargetingState::FAILED);
}

TEST_F(TargetingPipelineTest, WritesDebugArtifacts) {
  std::string dir = ::testing::TempDir() + "peck_debug_" + std::to_string(getpid());
  PeckTargetingPipeline::Options options = DefaultOptions();
  options.debug_dir = dir;

  TargetingResult result = RunWith(options);
  ASSERT_TRUE(result.success) << result.ToString();
  EXPECT_TRUE(FileExists(dir + "/capture.png"));
  EXPECT_TRUE(FileExists(dir + "/overlay.png"));
  EXPECT_TRUE(FileExists(dir + "/target_check.png"));

  unlink((dir + "/capture.png").c_str());
  unlink((dir + "/overlay.png").c_str());
  unlink((dir + "/target_check.png").c_str());
  rmdir(dir.c_str());
}

TEST_F(TargetingPipelineTest, UnwritableDebugDirDoesNotFailRun) {
  PeckTargetingPipeline::Options options = DefaultOptions();
  options.debug_dir = "/proc/peck-not-writable";
  EXPECT_TRUE(RunWith(options).success);
}

TEST(TargetingResultFormat, SummaryNamesStatusAndStage) {
  TargetingResult result = TargetingResult::Failure(
      TargetingStatus::TARGET_NOT_FOUND, TargetingState::QUERIED,
      "parse: no coordinate label found in model reply");
  std::string line = result.ToString();
  EXPECT_NE(line.find("status=target_not_found"), std::string::npos);
  EXPECT_NE(line.find("failed_at=queried"), std::string::npos);
  EXPECT_NE(line.find("no coordinate label found"), std::string::npos);
}
