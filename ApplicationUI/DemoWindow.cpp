#include "DemoWindow.hpp"

#include <QEvent>
#include <QExposeEvent>
#include <QPlatformSurfaceEvent>
#include <QResizeEvent>
#include <QVulkanInstance>
#include <cmath>
#include <iostream>
#include <numbers>
#include <vector>

#include "Colors.hpp"

namespace
{
    std::vector<glm::vec2> starPoints(glm::vec2 center, float outer, float inner)
    {
        std::vector<glm::vec2> pts;
        pts.reserve(10);
        for (int i = 0; i < 10; ++i)
        {
            const float r = (i % 2 == 0) ? outer : inner;
            const float a = std::numbers::pi_v<float> * 0.5f + float(i) * std::numbers::pi_v<float> / 5.0f;
            pts.push_back(center + r * glm::vec2(std::cos(a), std::sin(a)));
        }
        return pts;
    }
} // namespace

DemoWindow::DemoWindow(QVulkanInstance* instance) noexcept : m_instance(instance)
{
    setSurfaceType(QSurface::VulkanSurface);
    setVulkanInstance(m_instance);
}

DemoWindow::~DemoWindow()
{
    destroyEngine();
    m_instance = nullptr;
}

void DemoWindow::requestUpdateOnce() noexcept
{
    if (m_updateQueued)
        return;

    m_updateQueued = true;
    requestUpdate();
}

plaster::Extent2D DemoWindow::pixelExtent() const noexcept
{
    const qreal dpr = devicePixelRatio();
    return plaster::Extent2D{uint32_t(std::lround(double(width()) * double(dpr))),
                             uint32_t(std::lround(double(height()) * double(dpr)))};
}

bool DemoWindow::event(QEvent* e)
{
    if (e->type() == QEvent::PlatformSurface)
    {
        auto* pe = static_cast<QPlatformSurfaceEvent*>(e);
        if (pe->surfaceEventType() == QPlatformSurfaceEvent::SurfaceAboutToBeDestroyed)
        {
            m_exposed      = false;
            m_updateQueued = false;
            destroyEngine();
        }
    }

    if (e->type() == QEvent::UpdateRequest)
    {
        m_updateQueued = false;
        renderOnce();
        return true;
    }

    return QWindow::event(e);
}

void DemoWindow::exposeEvent(QExposeEvent* e)
{
    QWindow::exposeEvent(e);

    m_exposed = isExposed();
    if (!m_exposed)
        return;

    ensureEngine();
    requestUpdateOnce();
}

void DemoWindow::resizeEvent(QResizeEvent* e)
{
    QWindow::resizeEvent(e);

    if (!m_engine)
        return;

    const plaster::Extent2D px = pixelExtent();
    if (px.empty())
        return; // minimized; keep the old swapchain until we get a real size

    if (const plaster::ReconfigureError err = m_engine->resize(px); err != plaster::ReconfigureError::None)
        std::cerr << "DemoWindow: resize failed (" << plaster::toString(err) << ")\n";

    if (m_exposed)
        requestUpdateOnce();
}

void DemoWindow::ensureEngine() noexcept
{
    if (m_engine || m_initFailed || !m_instance)
        return;

    if (!handle())
        create();

    const plaster::Extent2D px = pixelExtent();
    if (px.empty())
        return;

    plaster::SurfaceTarget target;
    target.instance = m_instance->vkInstance();
    target.surface  = QVulkanInstance::surfaceForWindow(this);

    plaster::EngineSettings settings;
    settings.clearColor = {0.032f, 0.049f, 0.074f, 1.0f};

    if (const plaster::DeviceInitError err = plaster::Engine::create(target, px, settings, m_engine);
        err != plaster::DeviceInitError::None)
    {
        std::cerr << "DemoWindow: engine init failed (" << plaster::toString(err) << ")\n";
        m_initFailed = true;
        return;
    }

    submitScene();
}

void DemoWindow::destroyEngine() noexcept
{
    // Waits for the device before the surface goes away.
    m_engine.reset();
}

void DemoWindow::submitScene() noexcept
{
    using namespace plaster;

    std::vector<ShapeDescriptor> shapes;

    // Two stacked pixel-space squares at the top-left corner.
    {
        ShapeDescriptor s;
        s.id       = 1;
        s.geometry = Rect{{0.0f, 0.0f}, {100.0f, 100.0f}};
        s.color    = colors::WHITE;
        s.space    = CoordinateSpace::Pixels;
        shapes.push_back(s);
    }
    {
        ShapeDescriptor s;
        s.id       = 2;
        s.geometry = Rect{{0.0f, 100.0f}, {100.0f, 200.0f}};
        s.color    = colors::RED;
        s.space    = CoordinateSpace::Pixels;
        shapes.push_back(s);
    }

    {
        ShapeDescriptor s;
        s.id       = 3;
        s.geometry = Polygon{{{-0.5f, -0.5f}, {0.5f, -0.5f}, {0.0f, 0.5f}}};
        s.color    = colors::CYAN;
        shapes.push_back(s);
    }

    {
        ShapeDescriptor s;
        s.id       = 4;
        s.geometry = Circle{{0.55f, 0.45f}, 0.3f};
        s.color    = colors::YELLOW;
        s.layer    = 1;
        shapes.push_back(s);
    }

    {
        ShapeDescriptor s;
        s.id       = 5;
        s.geometry = Polygon{starPoints({-0.55f, 0.45f}, 0.3f, 0.12f)};
        s.color    = colors::PURPLE;
        s.winding  = WindingRule::EvenOdd;
        shapes.push_back(s);
    }

    m_engine->submitShapes(shapes);
}

void DemoWindow::renderOnce() noexcept
{
    if (!m_exposed)
        return;

    ensureEngine();
    if (!m_engine)
        return;

    const plaster::SurfaceAcquireError err = m_engine->renderFrame();

    // Transient: try again on the next update.
    if (err == plaster::SurfaceAcquireError::OutOfDate || err == plaster::SurfaceAcquireError::Timeout)
        requestUpdateOnce();
}
