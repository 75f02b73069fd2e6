#include "app/ShelfSenseApp.hpp"

int main(int argc, char** argv) {
    shelfsense::app::ShelfSenseApp app;
    return app.Run(argc, argv);
}
