#include "app/PatentLensApp.hpp"

int main(int argc, char** argv) {
    patentlens::app::PatentLensApp app;
    return app.Run(argc, argv);
}
