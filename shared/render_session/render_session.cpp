#include "render_session.hpp"
#include "util/RandomSource.hpp"
#include <exception>
#include <iostream>
#include <utility>

RenderSession::RenderSession()
    : rng_(std::make_unique<util::CvRandomSource>())
{
}

RenderSession::RenderSession(std::unique_ptr<util::RandomSource> rng)
    : rng_(rng ? std::move(rng) : std::make_unique<util::CvRandomSource>())
{
}

RenderSession::~RenderSession() = default;

void RenderSession::setSource(SourceImage source)
{
    source_ = std::move(source);
    noise_.reset();
}

void RenderSession::clearSource()
{
    setSource(SourceImage{});
}

RenderOutput RenderSession::render(const StyleParameters& rawParams, const ContainerBounds& bounds, const ToneSettings& tone)
{
    const StyleParameters params = sanitizeStyleParameters(rawParams);
    RenderOutput out;

    if (!source_.ready())
    {
        renderPlaceholder(source_.state == SourceState::DecodeFailed ? PlaceholderKind::DecodeFailed : PlaceholderKind::NoImage, out);
        out.motion = mapMotion(params.movement);
        last_ = out;
        return out;
    }

    bool ok = false;
    try
    {
        noise_.update(params, *rng_);
        ok = composeFrame(source_.bitmap, params, tone, bounds, noise_.profiles(), *rng_, out);
    }
    catch (const cv::Exception& e)
    {
        std::cerr << "[RenderSession::render] " << e.what() << "\n";
        ok = false;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[RenderSession::render] " << e.what() << "\n";
        ok = false;
    }
    if (!ok)
    {
        renderPlaceholder(PlaceholderKind::DecodeFailed, out);
        out.motion = mapMotion(params.movement);
    }
    last_ = out;
    return out;
}

void RenderSession::requestRender(const StyleParameters& params, const ContainerBounds& bounds, const ToneSettings& tone)
{
    pending_ = std::make_unique<PendingRequest>(PendingRequest{ params, bounds, tone });
}

bool RenderSession::flushPendingRender(RenderOutput& out)
{
    if (!pending_) return false;
    std::unique_ptr<PendingRequest> req = std::move(pending_);
    out = render(req->params, req->bounds, req->tone);
    return true;
}
