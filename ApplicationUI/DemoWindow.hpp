#pragma once

#include <QWindow>
#include <memory>

#include "Engine.hpp"

class QVulkanInstance;

/**
 * @brief Vulkan surface window that draws a fixed set of shapes.
 *
 * The engine is created on first expose and torn down before Qt destroys the
 * native surface. Rendering is driven by UpdateRequest events.
 */
class DemoWindow final : public QWindow
{
    Q_OBJECT
public:
    explicit DemoWindow(QVulkanInstance* instance) noexcept;
    ~DemoWindow() override;

    void requestUpdateOnce() noexcept;

protected:
    bool event(QEvent* e) override;

    void exposeEvent(QExposeEvent* e) override;
    void resizeEvent(QResizeEvent* e) override;

private:
    void ensureEngine() noexcept;
    void destroyEngine() noexcept;
    void renderOnce() noexcept;
    void submitScene() noexcept;

    [[nodiscard]] plaster::Extent2D pixelExtent() const noexcept;

private:
    QVulkanInstance*                m_instance = nullptr;
    std::unique_ptr<plaster::Engine> m_engine;

    bool m_exposed      = false;
    bool m_updateQueued = false;
    bool m_initFailed   = false;
};
