#include "app/bootstrap.h"

int main(int argc, char* argv[]) {
  sqlscope::app::bootstrap app(argc, argv);
  return app.execute();
}
