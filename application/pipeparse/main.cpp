#include <pipeparse/app.hpp>

int main(int argc, char **argv) { return pipeparse::App{}.run(argc, argv); }
