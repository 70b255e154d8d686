#include "App.h"

#include <glog/logging.h>

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;

  App app;
  if (!app.Initialize()) {
    return 1;
  }
  if (argc > 1) {
    app.OpenImage(argv[1]);
  }
  app.Run();
  app.Shutdown();
  return 0;
}
