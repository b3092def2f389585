#include <QCoreApplication>

#include "fixed_bench.h"

int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    return run_fixed_bench();
}
