#include <syncf/app.hpp>

int main(int argc, char** argv) {
    return syncf::App{}.run(argc, argv);
}
