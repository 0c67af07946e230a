/**
 * @file full_params_view.h
 * @brief whisper-safe - Scoped native parameter record
 *
 * Builds the whisper_full_params for one engine call from a FullParams.
 * The record points into the FullParams' owned storage, so a view must not
 * outlive the FullParams it was built from; it can be neither copied nor
 * moved and is only ever created on the stack of WhisperState::full().
 */

#ifndef WSF_FULL_PARAMS_VIEW_H
#define WSF_FULL_PARAMS_VIEW_H

#include <whisper.h>

#include <vector>

#include "wsf/features/stt/wsf_full_params.h"

namespace whispersafe {

struct SegmentBinding;
struct ProgressBinding;

class FullParamsView {
   public:
    FullParamsView(const FullParams& params, SegmentBinding* segment_binding,
                   ProgressBinding* progress_binding);

    FullParamsView(const FullParamsView&) = delete;
    FullParamsView& operator=(const FullParamsView&) = delete;
    FullParamsView(FullParamsView&&) = delete;
    FullParamsView& operator=(FullParamsView&&) = delete;

    const whisper_full_params& native() const { return native_; }

   private:
    whisper_full_params native_;
    std::vector<const whisper_grammar_element*> grammar_ptrs_;
};

}  // namespace whispersafe

#endif  // WSF_FULL_PARAMS_VIEW_H
