#ifndef PECK_TARGETING_PIPELINE_H_
#define PECK_TARGETING_PIPELINE_H_

#include <atomic>
#include <string>
#include "peck_capabilities.h"
#include "peck_grid_codec.h"
#include "targeting_result.h"

/**
 * PeckTargetingPipeline - Single-shot "label then click" grounding
 *
 * One Run() is one linear pass:
 *   IDLE -> CAPTURED -> OVERLAID -> QUERIED -> PARSED -> TRANSFORMED -> ACTED
 * and any stage may end the run in FAILED with exactly one TargetingStatus.
 * The pipeline never retries; QUERY_FAILED results are marked retriable
 * for the caller to decide.
 *
 * Runs are synchronous and must not overlap. A Run() issued while another
 * is in flight on the same instance fails with INVALID_PARAMETER.
 */
class PeckTargetingPipeline {
 public:
  struct Options {
    GridSpec grid;
    int settle_delay_ms = 500;
    std::string debug_dir;  // Empty disables debug artifacts
  };

  // Collaborators are borrowed and must outlive the pipeline
  PeckTargetingPipeline(IScreenCapture* capture,
                        IVisionModel* vision,
                        IInputInjector* input,
                        const Options& options);

  TargetingResult Run(const std::string& goal);

  // State of the most recent (or current) run
  TargetingState GetState() const { return state_.load(); }

  const Options& GetOptions() const { return options_; }

 private:
  // Mark result as failed at the current state and log the reason
  void Fail(TargetingResult& result, TargetingStatus status, const std::string& detail);

  void Advance(TargetingState next);

  IScreenCapture* capture_;
  IVisionModel* vision_;
  IInputInjector* input_;
  Options options_;
  PeckGridCodec codec_;

  std::atomic<TargetingState> state_;
  std::atomic<bool> running_;
};

#endif  // PECK_TARGETING_PIPELINE_H_
