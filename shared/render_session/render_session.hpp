/*========================  render_session.hpp  ========================

   Stateful front of the torn paper pipeline.
   --------------------------------------------------------------------
   • owns everything carried between renders: the source photo, the edge
     noise cache and the random source
   • a new source drops the cached noise; unrelated parameter changes
     keep it, so the tear shape holds still while sliders move
   • requestRender() keeps only the newest request; flushPendingRender()
     renders it once
   • render() never throws: failures come back as placeholder frames

=====================================================================*/
#pragma once
#include <memory>
#include "models/StyleParameters.hpp"
#include "models/ToneSettings.hpp"
#include "models/ContainerBounds.hpp"
#include "compositor.hpp"
#include "edge_noise.hpp"
#include "source_image.hpp"

namespace util { class RandomSource; }

class RenderSession
{
public:
    RenderSession();
    explicit RenderSession(std::unique_ptr<util::RandomSource> rng);
    ~RenderSession();

    RenderSession(const RenderSession&) = delete;
    RenderSession& operator=(const RenderSession&) = delete;

    void setSource(SourceImage source);
    void clearSource();
    const SourceImage& source() const { return source_; }

    RenderOutput render(const StyleParameters& params, const ContainerBounds& bounds = ContainerBounds(),
                        const ToneSettings& tone = ToneSettings());

    // Latest-wins request queue of depth one
    void requestRender(const StyleParameters& params, const ContainerBounds& bounds = ContainerBounds(),
                       const ToneSettings& tone = ToneSettings());
    bool hasPendingRender() const { return pending_ != nullptr; }
    bool flushPendingRender(RenderOutput& out);

    const RenderOutput& lastOutput() const { return last_; }
    const EdgeNoiseCache& noise() const { return noise_; }

private:
    struct PendingRequest
    {
        StyleParameters params;
        ContainerBounds bounds;
        ToneSettings tone;
    };

    std::unique_ptr<util::RandomSource> rng_;
    SourceImage source_;
    EdgeNoiseCache noise_;
    std::unique_ptr<PendingRequest> pending_;
    RenderOutput last_;
};
