#include <QGuiApplication>
#include <QVersionNumber>
#include <QVulkanInstance>
#include <cstdlib>

#include "DemoWindow.hpp"

int main(int argc, char* argv[])
{
    QGuiApplication app(argc, argv);

    QVulkanInstance instance;
    instance.setApiVersion(QVersionNumber(1, 1));

#ifndef NDEBUG
    instance.setLayers({"VK_LAYER_KHRONOS_validation"});
#endif

    if (!instance.create())
    {
        qCritical("Failed to create a Vulkan instance (error %d).", int(instance.errorCode()));
        return EXIT_FAILURE;
    }

    DemoWindow window(&instance);
    window.setTitle("Plaster");
    window.resize(800, 600);
    window.show();

    return app.exec();
}
