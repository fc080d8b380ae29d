#include <mxdiagram/mxdiagram.h>
#include <iostream>

int main() {
    using namespace mxdiagram;

    // 1. Two boxes and a connector
    {
        GraphModel model = newGraph();
        model.grid = "1";
        model.gridSize = "10";
        model.page = "1";

        Cell start = newShape("start", kDefaultLayerId);
        start.value = "Start";
        start.style.set("rounded", "1").set("whiteSpace", "wrap").set("html", "1");
        start.geometry->x = 40;
        start.geometry->y = 40;
        start.geometry->width = "120";
        start.geometry->height = "60";

        Cell finish = newShape("finish", kDefaultLayerId);
        finish.value = "Finish";
        finish.style.set("ellipse").set("fillColor", "#dae8fc");
        finish.geometry->x = 240;
        finish.geometry->y = 40;
        finish.geometry->width = "80";
        finish.geometry->height = "80";

        Cell link = newEdge("link", kDefaultLayerId, "start", "finish");
        link.style.set("endArrow", "classic").set("html", "1");

        model.add(start).add(finish).add(link);

        MxGraphXmlExport xml;
        if (!xml.exportToFile(model, "flow.drawio")) {
            std::cerr << "Failed to write flow.drawio\n";
            return 1;
        }
        std::cout << "Generated: flow.drawio\n";
    }

    // 2. Image gallery with a free-floating arrow
    {
        GraphModel model = newGraph();
        model.add(newImage("logo", kDefaultLayerId, "https://example.com/logo.png"));
        model.add(newImageXY("banner", kDefaultLayerId, "https://example.com/banner.png", 0, 200));

        Cell arrow;
        arrow.id = "arrow";
        arrow.parentId = kDefaultLayerId;
        arrow.edge = kFlagSet;
        arrow.geometry = Geometry{};
        arrow.geometry->relative = "1";
        arrow.geometry->point = MxPoint(300, 20, kTargetPointAs);
        model.add(arrow);

        for (const auto& violation : ModelValidator::validate(model)) {
            std::cout << violation.toString() << "\n";
        }

        MxGraphXmlExport xml(MxGraphXmlOptions{"  ", true, false});
        std::cout << xml.exportToString(model);
    }

    return 0;
}
